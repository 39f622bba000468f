/**
 * @file test_buffer_pool.cc
 * @brief Unit tests for the fixed pool of sample buffers
 */

#include <doctest/doctest.h>
#include <afqueue/buffer_pool.hh>
#include <afqueue/error.hh>

#include <sstream>

using namespace afqueue;

TEST_SUITE("BufferPool::Unit") {

    TEST_CASE("should_reject_invalid_geometry") {
        CHECK_THROWS_AS(buffer_pool(1, 64), config_error);
        CHECK_THROWS_AS(buffer_pool(0, 64), config_error);
        CHECK_THROWS_AS(buffer_pool(3, 0), config_error);
        CHECK_NOTHROW(buffer_pool(2, 1));
    }

    TEST_CASE("should_start_with_every_buffer_free") {
        buffer_pool pool(4, 128);

        CHECK(pool.size() == 4);
        CHECK(pool.capacity() == 128);
        CHECK(pool.count(buffer_state::free) == 4);
        for (std::size_t i = 0; i < pool.size(); i++) {
            CHECK(pool[i].capacity() == 128);
            CHECK(pool[i].length == 0);
        }
    }

    TEST_CASE("should_hand_out_each_free_buffer_once") {
        buffer_pool pool(3, 16);

        auto a = pool.acquire_free();
        auto b = pool.acquire_free();
        auto c = pool.acquire_free();
        REQUIRE(a);
        REQUIRE(b);
        REQUIRE(c);
        CHECK(*a != *b);
        CHECK(*b != *c);
        CHECK(*a != *c);
        CHECK_FALSE(pool.acquire_free());
        CHECK(pool.count(buffer_state::filling) == 3);
    }

    TEST_CASE("should_only_transition_from_the_expected_state") {
        buffer_pool pool(2, 16);

        CHECK_FALSE(pool.transition(0, buffer_state::filled, buffer_state::playing));
        CHECK(pool.transition(0, buffer_state::free, buffer_state::filling));
        CHECK_FALSE(pool.transition(0, buffer_state::free, buffer_state::filling));
        CHECK(pool.transition(0, buffer_state::filling, buffer_state::filled));
        CHECK(pool[0].state.load() == buffer_state::filled);
    }

    TEST_CASE("should_find_oldest_filled_buffer_of_an_epoch") {
        buffer_pool pool(4, 16);

        auto fill = [&](std::size_t i, epoch_t epoch, uint64_t seq) {
            REQUIRE(pool.transition(i, buffer_state::free, buffer_state::filling));
            pool[i].epoch = epoch;
            pool[i].sequence = seq;
            REQUIRE(pool.transition(i, buffer_state::filling, buffer_state::filled));
        };

        fill(0, 1, 7);
        fill(1, 1, 5);
        fill(2, 0, 1);
        fill(3, 1, 6);

        auto oldest = pool.oldest_filled(1);
        REQUIRE(oldest);
        CHECK(*oldest == 1);

        auto old_epoch = pool.oldest_filled(0);
        REQUIRE(old_epoch);
        CHECK(*old_epoch == 2);

        CHECK_FALSE(pool.oldest_filled(2));
    }

    TEST_CASE("should_reset_every_buffer") {
        buffer_pool pool(3, 16);
        REQUIRE(pool.acquire_free());
        REQUIRE(pool.transition(1, buffer_state::free, buffer_state::playing));
        pool[1].length = 10;

        pool.reset_all();

        CHECK(pool.count(buffer_state::free) == 3);
        CHECK(pool[1].length == 0);
    }

    TEST_CASE("should_print_buffer_states") {
        std::ostringstream os;
        os << buffer_state::filled << ' ' << buffer_state::consumed;
        CHECK(os.str() == "filled consumed");
    }
}
