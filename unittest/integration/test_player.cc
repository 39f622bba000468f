/**
 * @file test_player.cc
 * @brief End-to-end playback sessions over synthetic tracks
 *
 * Sessions run against the null backend, which consumes audio in real
 * time, so tracks are kept to a few tens of milliseconds. Device failures
 * are injected through the mock backend.
 */

#include <doctest/doctest.h>
#include <afqueue/player.hh>
#include <afqueue/command_channel.hh>
#include <afqueue/error.hh>
#include <afqueue/status_display.hh>
#include <afqueue/backends/null/null_backend.hh>
#include <afqueue/sdk/audio_backend.hh>
#include <afqueue/sdk/decoders_registry.hh>
#include "../mock_backends.hh"
#include "../mock_components.hh"

#include <atomic>
#include <chrono>
#include <thread>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace afqueue;
using namespace afqueue::test;
using namespace std::chrono_literals;

namespace {
    constexpr sample_rate_t RATE = 1000;

    struct session {
        decoders_registry registry;
        media_library media;
        command_channel channel;
        player_config config;
        test_decoder::call_counter_t decode_calls = std::make_shared<std::atomic<std::size_t>>(0);

        session() {
            register_test_decoder(registry, 0, decode_calls);
            config.buffer_count = 3;
            config.buffer_duration = 20ms;
            config.status_refresh = 20ms;
        }

        // A track of @p ms milliseconds of 1 kHz mono
        void add_track(const std::string& path, uint32_t ms, uint32_t fail_at = NO_FAILURE) {
            media.add(path, make_test_track(RATE, 1, ms * RATE / 1000, fail_at));
        }

        std::unique_ptr<player> make_player(const std::vector<std::string>& paths,
                                            std::shared_ptr<audio_backend> backend = nullptr,
                                            status_display* display = nullptr) {
            if (!backend) {
                backend = create_null_backend();
            }
            return std::make_unique<player>(config, paths, backend, registry, channel, display,
                                            media.opener());
        }
    };
}

TEST_SUITE("Player::Integration") {

    TEST_CASE("should_play_every_track_to_the_end") {
        session s;
        s.add_track("a.afq", 60);
        s.add_track("b.afq", 40);
        s.add_track("c.afq", 50);

        auto p = s.make_player({"a.afq", "b.afq", "c.afq"});
        CHECK(p->status() == playback_status::stopped);
        CHECK(p->run() == 0);

        CHECK(p->status() == playback_status::finished);
        CHECK(p->loaded_tracks() == 3);
        CHECK(p->failed_tracks() == 0);
        CHECK(p->tracks().is_finished());
        CHECK(p->state().epoch() == 3);
    }

    TEST_CASE("should_play_the_same_file_twice") {
        session s;
        s.add_track("loop.afq", 30);

        auto p = s.make_player({"loop.afq", "loop.afq"});
        CHECK(p->run() == 0);
        CHECK(p->loaded_tracks() == 2);
        CHECK(p->status() == playback_status::finished);
    }

    TEST_CASE("should_skip_unreadable_files") {
        session s;
        s.add_track("a.afq", 30);
        s.media.add("garbage.bin", {1, 2, 3, 4, 5, 6, 7, 8});
        s.add_track("c.afq", 30);

        std::ostringstream out;
        status_display display(out, false);
        auto p = s.make_player({"a.afq", "missing.afq", "garbage.bin", "c.afq"}, nullptr, &display);
        CHECK(p->run() == 0);

        CHECK(p->status() == playback_status::finished);
        CHECK(p->loaded_tracks() == 2);
        CHECK(p->failed_tracks() == 2);

        const auto text = out.str();
        CHECK(text.find("(1/4) a.afq") != std::string::npos);
        CHECK(text.find("(4/4) c.afq") != std::string::npos);
        CHECK(text.find("missing.afq") != std::string::npos);
        CHECK(text.find("Unrecognised audio format: garbage.bin") != std::string::npos);
    }

    TEST_CASE("should_finish_when_no_track_can_be_opened") {
        session s;
        auto p = s.make_player({"nope.afq", "gone.afq"});

        CHECK(p->run() == 0);
        CHECK(p->status() == playback_status::finished);
        CHECK(p->loaded_tracks() == 0);
        CHECK(p->failed_tracks() == 2);
    }

    TEST_CASE("should_skip_tracks_that_fail_while_decoding") {
        session s;
        s.add_track("broken.afq", 1000, 30);
        s.add_track("fine.afq", 30);

        auto p = s.make_player({"broken.afq", "fine.afq"});
        CHECK(p->run() == 0);

        CHECK(p->status() == playback_status::finished);
        CHECK(p->loaded_tracks() == 2);
        CHECK(p->failed_tracks() == 1);
    }

    TEST_CASE("should_reach_the_end_after_one_skip_per_track") {
        session s;
        for (const char* name : {"a.afq", "b.afq", "c.afq"}) {
            s.add_track(name, 10000);
        }
        for (int i = 0; i < 3; i++) {
            s.channel.push(command::make(command_type::skip));
        }

        auto p = s.make_player({"a.afq", "b.afq", "c.afq"});
        const auto start = std::chrono::steady_clock::now();
        CHECK(p->run() == 0);

        CHECK(std::chrono::steady_clock::now() - start < 5s);
        CHECK(p->status() == playback_status::finished);
        CHECK(p->loaded_tracks() == 3);
        CHECK(p->state().epoch() == 3);

        // Once finished no track is decoded any further
        const auto decoded = s.decode_calls->load();
        CHECK(decoded > 0);
        std::this_thread::sleep_for(50ms);
        CHECK(s.decode_calls->load() == decoded);
    }

    TEST_CASE("should_stop_on_exit_request") {
        session s;
        s.add_track("long.afq", 10000);
        s.channel.push(command::make(command_type::volume_down));
        s.channel.push(command::make(command_type::toggle_pause));
        s.channel.push(command::make(command_type::exit));
        s.channel.push(command::make(command_type::skip));

        auto p = s.make_player({"long.afq", "long.afq"});
        CHECK(p->run() == 0);

        CHECK(p->status() == playback_status::paused);
        CHECK(p->state().gain() == doctest::Approx(15.0f / 16.0f));
        CHECK(p->loaded_tracks() == 1);
        // Commands after exit are left unread
        CHECK(s.channel.size() == 1);
    }

    TEST_CASE("should_stop_when_the_channel_closes") {
        session s;
        s.add_track("long.afq", 10000);
        s.channel.close();

        auto p = s.make_player({"long.afq"});
        CHECK(p->run() == 0);
        CHECK(p->status() == playback_status::playing);
    }

    TEST_CASE("should_ignore_events_from_older_epochs") {
        session s;
        s.add_track("long.afq", 10000);
        s.channel.push(command::track_finished(7));
        s.channel.push(command::track_failed(7, "stale"));
        s.channel.push(command::make(command_type::exit));

        auto p = s.make_player({"long.afq"});
        CHECK(p->run() == 0);
        CHECK(p->status() == playback_status::playing);
        CHECK(p->failed_tracks() == 0);
        CHECK(p->state().epoch() == 0);
    }

    TEST_CASE("should_end_in_error_when_the_device_fails") {
        session s;
        s.add_track("a.afq", 30);
        auto backend = std::make_shared<mock_backend>();
        backend->fail_open_device = true;

        auto p = s.make_player({"a.afq"}, backend);
        CHECK(p->run() == 1);
        CHECK(p->status() == playback_status::error);
        CHECK(p->loaded_tracks() == 0);
    }

    TEST_CASE("should_end_in_error_when_the_device_disappears") {
        session s;
        s.add_track("long.afq", 10000);
        s.add_track("next.afq", 10000);
        auto backend = std::make_shared<mock_backend>();

        auto p = s.make_player({"long.afq", "next.afq"}, backend);
        std::thread unplug([&backend] {
            std::this_thread::sleep_for(50ms);
            backend->lose_device();
        });
        const auto start = std::chrono::steady_clock::now();
        const int rc = p->run();
        unplug.join();

        CHECK(rc == 1);
        CHECK(std::chrono::steady_clock::now() - start < 5s);
        CHECK(p->status() == playback_status::error);
        CHECK(p->loaded_tracks() == 1);
        CHECK(backend->live_streams() == 0);
    }

    TEST_CASE("should_start_one_stream_per_track") {
        session s;
        s.add_track("a.afq", 10000);
        s.add_track("b.afq", 10000);
        s.channel.push(command::make(command_type::skip));
        s.channel.push(command::make(command_type::exit));

        auto backend = std::make_shared<mock_backend>();
        auto p = s.make_player({"a.afq", "b.afq"}, backend);
        CHECK(p->run() == 0);

        CHECK(backend->create_stream_calls == 2);
        CHECK(backend->live_streams() == 0);
        CHECK(backend->close_device_calls == 1);
        CHECK(p->loaded_tracks() == 2);
    }

    TEST_CASE("should_reject_invalid_configuration") {
        session s;
        s.config.buffer_count = 1;
        CHECK_THROWS_AS(s.make_player({"a.afq"}), config_error);
    }
}
