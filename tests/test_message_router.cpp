#include "doctest/doctest.h"
#include "message.hpp"
#include "message_router.hpp"
#include "state_store.hpp"
#include "test_helpers.hpp"
#include <limits>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

// Collects everything the router broadcasts
struct recording_sink {
    std::mutex mutex;
    std::vector<Message> messages;

    message_router::broadcast_fn fn() {
        return [this](const Message &message) {
            std::lock_guard<std::mutex> lock(mutex);
            messages.push_back(message);
        };
    }
};

GameStateSnapshot world_with_enemy_seven() {
    GameStateSnapshot state;
    state.enemies[7] = make_enemy(7, 60.0f);
    state.items[2] = make_item(2, "sword");
    return state;
}

} // namespace

TEST_SUITE("message_router") {

TEST_CASE("lethal damage removes the enemy and announces the drops") {
    state_store store(world_with_enemy_seven());
    recording_sink sink;
    message_router router(store, sink.fn());

    router.handle_message(1, Message(EnemyDamagePacket{7, 60.0f, {"sword"}}));

    CHECK_FALSE(store.has_enemy(7));
    REQUIRE(sink.messages.size() == 1);
    REQUIRE(sink.messages[0].GetType() == MessageType::EnemyDied);
    const auto &died = sink.messages[0].As<EnemyDiedPacket>();
    CHECK(died.enemy_id == 7);
    CHECK(died.drops == std::vector<std::string>{"sword"});
}

TEST_CASE("non-lethal damage reports the remaining hp") {
    state_store store(world_with_enemy_seven());
    recording_sink sink;
    message_router router(store, sink.fn());

    router.handle_message(1, Message(EnemyDamagePacket{7, 20.0f, {}}));

    CHECK(store.snapshot().enemies.at(7).hp == doctest::Approx(40.0f));
    REQUIRE(sink.messages.size() == 1);
    REQUIRE(sink.messages[0].GetType() == MessageType::EnemyDamaged);
    const auto &damaged = sink.messages[0].As<EnemyDamagedPacket>();
    CHECK(damaged.enemy_id == 7);
    CHECK(damaged.hp == doctest::Approx(40.0f));
}

TEST_CASE("damage against a missing enemy is silent") {
    state_store store(world_with_enemy_seven());
    recording_sink sink;
    message_router router(store, sink.fn());

    router.handle_message(1, Message(EnemyDamagePacket{42, 20.0f, {}}));
    CHECK(sink.messages.empty());
}

TEST_CASE("negative or non-finite damage is dropped") {
    state_store store(world_with_enemy_seven());
    recording_sink sink;
    message_router router(store, sink.fn());

    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    router.handle_message(1, Message(EnemyDamagePacket{7, nan, {}}));
    router.handle_message(1, Message(EnemyDamagePacket{7, inf, {}}));
    router.handle_message(1, Message(EnemyDamagePacket{7, -30.0f, {}}));

    CHECK(sink.messages.empty());
    CHECK(store.snapshot().enemies.at(7).hp == doctest::Approx(60.0f));

    // The enemy can still be killed afterwards
    router.handle_message(1, Message(EnemyDamagePacket{7, 60.0f, {}}));
    CHECK_FALSE(store.has_enemy(7));
    REQUIRE(sink.messages.size() == 1);
    CHECK(sink.messages[0].GetType() == MessageType::EnemyDied);
}

TEST_CASE("pickups resolve once and credit the sender") {
    state_store store(world_with_enemy_seven());
    recording_sink sink;
    message_router router(store, sink.fn());

    router.handle_message(3, Message(PickupItemPacket{2}));
    router.handle_message(1, Message(PickupItemPacket{2}));

    CHECK_FALSE(store.has_item(2));
    REQUIRE(sink.messages.size() == 1);
    const auto &picked = sink.messages[0].As<ItemPickedUpPacket>();
    CHECK(picked.item_id == 2);
    CHECK(picked.player_id == 3);
}

TEST_CASE("attacks are relayed without touching state") {
    state_store store(world_with_enemy_seven());
    recording_sink sink;
    message_router router(store, sink.fn());

    AttackData swing{30.0f, 50.0f, 0.5f, 1.0f, 2.0f};
    router.handle_message(2, Message(AttackPacket{swing}));

    CHECK(store.snapshot() == world_with_enemy_seven());
    REQUIRE(sink.messages.size() == 1);
    const auto &relay = sink.messages[0].As<PlayerAttackPacket>();
    CHECK(relay.player_id == 2);
    CHECK(relay.attack_data == swing);
}

TEST_CASE("player updates are absorbed into the snapshot") {
    state_store store;
    recording_sink sink;
    message_router router(store, sink.fn());

    router.handle_message(1, Message(PlayerUpdatePacket{make_player(1, 8.0f, 9.0f)}));

    CHECK(sink.messages.empty());
    GameStateSnapshot state = store.snapshot();
    REQUIRE(state.players.count(1) == 1);
    CHECK(state.players.at(1).x == doctest::Approx(8.0f));
}

TEST_CASE("host-to-client messages from a client are ignored") {
    state_store store(world_with_enemy_seven());
    recording_sink sink;
    message_router router(store, sink.fn());

    router.handle_message(1, Message(EnemyDiedPacket{7, {}}));
    router.handle_message(1, Message(GameStatePacket{GameStateSnapshot()}));

    CHECK(store.has_enemy(7));
    CHECK(sink.messages.empty());
}

TEST_CASE("concurrent damage from several players kills exactly once") {
    GameStateSnapshot initial;
    initial.enemies[7] = make_enemy(7, 500.0f);
    state_store store(initial);
    recording_sink sink;
    message_router router(store, sink.fn());

    std::vector<std::thread> players;
    for (uint32_t id = 0; id < 4; ++id) {
        players.emplace_back([&router, id] {
            for (int i = 0; i < 100; ++i)
                router.handle_message(
                    id, Message(EnemyDamagePacket{7, 5.0f, {"sword"}}));
        });
    }
    for (auto &player : players)
        player.join();

    int died = 0;
    int damaged = 0;
    for (auto const &message : sink.messages) {
        if (message.GetType() == MessageType::EnemyDied)
            ++died;
        else if (message.GetType() == MessageType::EnemyDamaged)
            ++damaged;
    }
    CHECK(died == 1);
    CHECK(damaged == 99);
    CHECK_FALSE(store.has_enemy(7));
}

}
