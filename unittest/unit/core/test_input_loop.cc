/**
 * @file test_input_loop.cc
 * @brief Unit tests for key mapping and the keyboard reader thread
 */

#include <doctest/doctest.h>
#include <afqueue/command_channel.hh>
#include <afqueue/input_loop.hh>

#include <chrono>
#include <unistd.h>

using namespace afqueue;
using namespace std::chrono_literals;

namespace {
    struct pipe_fds {
        int read_end = -1;
        int write_end = -1;

        pipe_fds() {
            int fds[2];
            REQUIRE(::pipe(fds) == 0);
            read_end = fds[0];
            write_end = fds[1];
        }

        ~pipe_fds() {
            close_writer();
            if (read_end >= 0) {
                ::close(read_end);
            }
        }

        void write(const char* bytes, size_t n) const {
            REQUIRE(::write(write_end, bytes, n) == static_cast<ssize_t>(n));
        }

        void close_writer() {
            if (write_end >= 0) {
                ::close(write_end);
                write_end = -1;
            }
        }
    };
}

TEST_SUITE("InputLoop::Unit") {

    TEST_CASE("should_map_the_control_keys") {
        CHECK(map_key('n') == command_type::skip);
        CHECK(map_key('p') == command_type::toggle_pause);
        CHECK(map_key(']') == command_type::volume_up);
        CHECK(map_key('[') == command_type::volume_down);
        CHECK(map_key('q') == command_type::exit);
    }

    TEST_CASE("should_ignore_other_keys") {
        CHECK_FALSE(map_key('N'));
        CHECK_FALSE(map_key('x'));
        CHECK_FALSE(map_key(' '));
        CHECK_FALSE(map_key('\n'));
        CHECK_FALSE(map_key('\x1b'));
    }

    TEST_CASE("should_forward_keys_in_order") {
        pipe_fds fds;
        command_channel channel;
        input_loop keys(fds.read_end, channel, 10ms);
        keys.start();

        fds.write("nx]p", 4);

        auto first = channel.pop_for(1000ms);
        auto second = channel.pop_for(1000ms);
        auto third = channel.pop_for(1000ms);
        keys.stop();

        REQUIRE(first);
        REQUIRE(second);
        REQUIRE(third);
        CHECK(first->type == command_type::skip);
        CHECK(second->type == command_type::volume_up);
        CHECK(third->type == command_type::toggle_pause);
        CHECK_FALSE(channel.try_pop());
    }

    TEST_CASE("should_request_exit_at_end_of_input") {
        pipe_fds fds;
        command_channel channel;
        input_loop keys(fds.read_end, channel, 10ms);
        keys.start();

        fds.close_writer();

        auto cmd = channel.pop_for(1000ms);
        REQUIRE(cmd);
        CHECK(cmd->type == command_type::exit);
        keys.stop();
        CHECK_FALSE(keys.is_running());
    }

    TEST_CASE("should_stop_promptly_without_input") {
        pipe_fds fds;
        command_channel channel;
        input_loop keys(fds.read_end, channel, 10ms);
        keys.start();
        CHECK(keys.is_running());

        const auto start = std::chrono::steady_clock::now();
        keys.stop();
        CHECK(std::chrono::steady_clock::now() - start < 500ms);
        CHECK(channel.size() == 0);
    }
}
