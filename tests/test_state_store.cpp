#include "doctest/doctest.h"
#include "state_store.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <thread>
#include <vector>

TEST_SUITE("state_store") {

TEST_CASE("damage accumulates until the enemy dies") {
    GameStateSnapshot initial;
    initial.enemies[7] = make_enemy(7, 60.0f);
    state_store store(initial);

    damage_result first = store.apply_enemy_damage(7, 20.0f);
    CHECK(first.outcome == damage_outcome::damaged);
    CHECK(first.hp == doctest::Approx(40.0f));
    CHECK(store.snapshot().enemies.at(7).hp == doctest::Approx(40.0f));

    damage_result second = store.apply_enemy_damage(7, 40.0f);
    CHECK(second.outcome == damage_outcome::died);
    CHECK_FALSE(store.has_enemy(7));

    damage_result third = store.apply_enemy_damage(7, 10.0f);
    CHECK(third.outcome == damage_outcome::missing);
}

TEST_CASE("items can only be taken once") {
    GameStateSnapshot initial;
    initial.items[2] = make_item(2, "sword");
    state_store store(initial);

    CHECK(store.take_item(2));
    CHECK_FALSE(store.take_item(2));
    CHECK_FALSE(store.has_item(2));
}

TEST_CASE("partial updates only replace the fields they carry") {
    GameStateSnapshot initial;
    initial.enemies[1] = make_enemy(1, 30.0f);
    initial.level = 1;
    state_store store(initial);

    StateUpdate update;
    update.items = std::map<uint32_t, ItemView>{{5, make_item(5, "spear")}};
    update.level = 2;
    store.update_game_state(update);

    GameStateSnapshot state = store.snapshot();
    CHECK(state.level == 2);
    CHECK(state.items.count(5) == 1);
    CHECK(state.enemies.count(1) == 1);
}

TEST_CASE("removed enemies and items never come back under the same id") {
    GameStateSnapshot initial;
    initial.enemies[7] = make_enemy(7, 10.0f);
    initial.items[2] = make_item(2, "sword");
    state_store store(initial);

    REQUIRE(store.apply_enemy_damage(7, 10.0f).outcome ==
            damage_outcome::died);
    REQUIRE(store.take_item(2));

    // Stale view from game logic that has not seen the death or pickup yet
    StateUpdate stale;
    stale.enemies = std::map<uint32_t, EnemyView>{{7, make_enemy(7, 10.0f)},
                                                  {8, make_enemy(8, 30.0f)}};
    stale.items = std::map<uint32_t, ItemView>{{2, make_item(2, "sword")}};
    store.update_game_state(stale);

    GameStateSnapshot state = store.snapshot();
    CHECK(state.enemies.count(7) == 0);
    CHECK(state.enemies.count(8) == 1);
    CHECK(state.items.empty());
}

TEST_CASE("player entries use the session id and stay gone after leaving") {
    state_store store;

    CHECK(store.update_player(3, make_player(99, 1.0f, 2.0f)));
    GameStateSnapshot state = store.snapshot();
    REQUIRE(state.players.count(3) == 1);
    CHECK(state.players.at(3).player_id == 3);

    CHECK(store.remove_player(3));
    CHECK_FALSE(store.remove_player(3));
    CHECK_FALSE(store.update_player(3, make_player(3, 1.0f, 2.0f)));
    CHECK_FALSE(store.has_player(3));
}

TEST_CASE("concurrent damage resolves the death exactly once") {
    GameStateSnapshot initial;
    initial.enemies[7] = make_enemy(7, 1000.0f);
    state_store store(initial);

    constexpr int THREADS = 8;
    constexpr int HITS_PER_THREAD = 50;
    std::atomic<int> damaged{0};
    std::atomic<int> died{0};
    std::atomic<int> missing{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < HITS_PER_THREAD; ++i) {
                switch (store.apply_enemy_damage(7, 3.0f).outcome) {
                case damage_outcome::damaged:
                    ++damaged;
                    break;
                case damage_outcome::died:
                    ++died;
                    break;
                case damage_outcome::missing:
                    ++missing;
                    break;
                }
            }
        });
    }
    for (auto &thread : threads)
        thread.join();

    // 334 hits of 3 are needed to go through 1000 hp
    CHECK(died.load() == 1);
    CHECK(damaged.load() == 333);
    CHECK(missing.load() == THREADS * HITS_PER_THREAD - 334);
    CHECK_FALSE(store.has_enemy(7));
}

}
