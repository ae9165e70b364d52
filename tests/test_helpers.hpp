#pragma once

#include "views/game_state.hpp"
#include <SFML/System/Clock.hpp>
#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>
#include <string>

inline EnemyView make_enemy(uint32_t id, float hp) {
    EnemyView enemy;
    enemy.enemy_id = id;
    enemy.type = "ant";
    enemy.hp = hp;
    enemy.max_hp = hp;
    enemy.state = "idle";
    return enemy;
}

inline ItemView make_item(uint32_t id, const std::string &item_class) {
    ItemView item;
    item.item_id = id;
    item.item_type = "weapon";
    item.item_class = item_class;
    item.name = item_class;
    return item;
}

inline PlayerView make_player(uint32_t id, float x, float y) {
    PlayerView player;
    player.player_id = id;
    player.name = "Player" + std::to_string(id);
    player.x = x;
    player.y = y;
    return player;
}

// Polls until the predicate holds or the timeout expires
template <typename Predicate>
bool wait_until(Predicate predicate, sf::Time timeout = sf::seconds(3)) {
    sf::Clock clock;
    while (clock.getElapsedTime() < timeout) {
        if (predicate())
            return true;
        sf::sleep(sf::milliseconds(5));
    }
    return predicate();
}
