/**
 * @file test_status_display.cc
 * @brief Unit tests for status line formatting and screen output
 */

#include <doctest/doctest.h>
#include <afqueue/status_display.hh>

#include <optional>
#include <sstream>
#include <string>

using namespace afqueue;
using namespace std::chrono_literals;

TEST_SUITE("StatusDisplay::Unit") {

    TEST_CASE("should_format_times") {
        CHECK(format_time(0ms) == "0:00");
        CHECK(format_time(5999ms) == "0:05");
        CHECK(format_time(61000ms) == "1:01");
        CHECK(format_time(std::chrono::milliseconds(3600 * 1000 + 62 * 1000)) == "1:01:02");
        CHECK(format_time(-5000ms) == "0:00");
    }

    TEST_CASE("should_format_the_status_line") {
        status_snapshot s;
        s.status = playback_status::playing;
        s.elapsed = 5000ms;
        s.duration = std::chrono::microseconds(180000000);
        s.gain = 1.0f;

        CHECK(format_status_line(s) == "[Playing] 0:05 / 3:00  vol 100%");

        s.status = playback_status::paused;
        s.gain = 0.5f;
        s.underruns = 3;
        CHECK(format_status_line(s) == "[Paused] 0:05 / 3:00  vol 50%  underruns 3");
    }

    TEST_CASE("should_omit_unknown_duration") {
        status_snapshot s;
        s.status = playback_status::skipping;
        s.elapsed = 0ms;
        CHECK(format_status_line(s) == "[Skipping] 0:00  vol 100%");
    }

    TEST_CASE("should_scale_meter_bars") {
        const std::string cell = "\xe2\x96\x88";
        CHECK(format_meter(0.0f, 10).empty());
        CHECK(format_meter(1.0f, 10).size() == 10 * cell.size());
        CHECK(format_meter(0.5f, 10).size() == 5 * cell.size());
        CHECK(format_meter(7.0f, 4).size() == 4 * cell.size());
        CHECK(format_meter(-1.0f, 4).empty());
    }

    TEST_CASE("should_show_track_properties") {
        std::ostringstream out;
        status_display display(out, false);

        format_info fmt;
        fmt.sample_rate = 44100;
        fmt.channels = 2;
        fmt.duration = std::chrono::microseconds(61000000);
        fmt.decoder_name = "WAV (dr_wav)";
        display.show_track(1, 3, "song.wav", fmt);

        const auto text = out.str();
        CHECK(text.find("(2/3) song.wav") != std::string::npos);
        CHECK(text.find("Properties:") != std::string::npos);
        CHECK(text.find("sample rate: 44100 Hz") != std::string::npos);
        CHECK(text.find("channels: 2") != std::string::npos);
        CHECK(text.find("duration: 1:01") != std::string::npos);
        CHECK(text.find("\x1b[2J") == std::string::npos);
    }

    TEST_CASE("should_clear_screen_only_with_ansi") {
        std::ostringstream out;
        status_display display(out, true);
        display.show_track(0, 1, "a.flac", format_info{});
        CHECK(out.str().rfind("\x1b[2J", 0) == 0);
    }

    TEST_CASE("should_skip_live_updates_without_ansi") {
        std::ostringstream out;
        status_display display(out, false);
        status_snapshot s;
        s.status = playback_status::playing;
        display.update(s);
        CHECK(out.str().empty());
    }

    TEST_CASE("should_redraw_status_block_in_place") {
        std::ostringstream out;
        status_display display(out, true);
        display.set_width(20);

        status_snapshot s;
        s.status = playback_status::playing;
        s.levels = {0.5f, 1.0f};
        display.update(s);
        const auto first = out.str();
        CHECK(first.find("[Playing]") != std::string::npos);
        CHECK(first.find("ch2 ") != std::string::npos);
        CHECK(first.find("\x1b[2A") == std::string::npos);

        display.update(s);
        // Second draw climbs back over the two meter lines
        CHECK(out.str().find("\x1b[2A", first.size()) != std::string::npos);
    }

    TEST_CASE("should_print_messages_on_their_own_line") {
        std::ostringstream out;
        status_display display(out, false);
        display.show_message("skipping: broken.mp3");
        CHECK(out.str() == "skipping: broken.mp3\r\n");
    }

    TEST_CASE("should_list_tags_with_the_properties") {
        std::ostringstream out;
        status_display display(out, false);

        format_info fmt;
        fmt.sample_rate = 44100;
        fmt.channels = 2;
        fmt.decoder_name = "FLAC (dr_flac)";
        fmt.tags = {{"title", "Night Drive"}, {"artist", "Someone"}};
        display.show_track(0, 1, "a.flac", fmt);

        const auto text = out.str();
        const auto title = text.find("title: Night Drive\r\n");
        const auto artist = text.find("artist: Someone\r\n");
        REQUIRE(title != std::string::npos);
        REQUIRE(artist != std::string::npos);
        CHECK(text.find("Properties:") < title);
        CHECK(title < artist);
        CHECK(artist < text.find("keys:"));
    }

    TEST_CASE("should_redraw_the_header_at_a_new_width") {
        const std::string cell = "\xe2\x96\x88";
        const auto full_bar = [&cell](std::size_t cells) {
            std::string bar;
            for (std::size_t i = 0; i < cells; i++) {
                bar += cell;
            }
            return "ch1 " + bar + "\x1b[K";
        };
        std::ostringstream out;
        status_display display(out, true);
        display.set_width(40);

        format_info fmt;
        fmt.sample_rate = 48000;
        fmt.channels = 1;
        display.show_track(2, 5, "wide.wav", fmt);

        std::optional<std::size_t> pending;
        display.set_width_source([&pending]() {
            auto columns = pending;
            pending.reset();
            return columns;
        });

        status_snapshot s;
        s.status = playback_status::playing;
        s.levels = {1.0f};
        display.update(s);
        CHECK(out.str().find(full_bar(32)) != std::string::npos);

        out.str("");
        pending = 20;
        display.update(s);
        const auto text = out.str();
        CHECK(display.width() == 20);
        CHECK(text.rfind("\x1b[2J", 0) == 0);
        CHECK(text.find("(3/5) wide.wav") != std::string::npos);
        // Redrawn from a clean screen, so no climb over the old block
        CHECK(text.find("\x1b[1A") == std::string::npos);
        CHECK(text.find(full_bar(12)) != std::string::npos);
    }

    TEST_CASE("should_ignore_an_unchanged_width") {
        std::ostringstream out;
        status_display display(out, true);
        display.set_width(40);
        display.show_track(0, 1, "a.wav", format_info{});
        out.str("");

        display.resize(40);
        display.resize(0);
        CHECK(out.str().empty());
        CHECK(display.width() == 40);
    }
}
