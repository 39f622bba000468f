/**
 * @file test_decoder_feed.cc
 * @brief Unit tests for opening tracks and reading frames into buffers
 */

#include <doctest/doctest.h>
#include <afqueue/decoder_feed.hh>
#include <afqueue/sample_buffer.hh>
#include <afqueue/error.hh>
#include "../../mock_components.hh"

#include <sstream>

using namespace afqueue;
using namespace afqueue::test;

TEST_SUITE("DecoderFeed::Unit") {

    TEST_CASE("should_report_missing_files_as_io_errors") {
        decoders_registry registry;
        register_test_decoder(registry);
        media_library media;
        decoder_feed feed(registry, media.opener());

        CHECK_THROWS_AS(feed.open("missing.wav"), io_error);
        CHECK_FALSE(feed.is_open());
    }

    TEST_CASE("should_report_missing_files_on_disk_as_io_errors") {
        decoders_registry registry;
        register_test_decoder(registry);
        decoder_feed feed(registry);

        CHECK_THROWS_AS(feed.open("/nonexistent/afqueue/track.wav"), io_error);
    }

    TEST_CASE("should_reject_unknown_formats") {
        decoders_registry registry;
        register_test_decoder(registry);
        media_library media;
        media.add("noise.bin", {0x00, 0x01, 0x02, 0x03, 0x04, 0x05});
        decoder_feed feed(registry, media.opener());

        CHECK_THROWS_AS(feed.open("noise.bin"), decoder_error);
        CHECK_FALSE(feed.is_open());
    }

    TEST_CASE("should_reject_truncated_headers") {
        decoders_registry registry;
        register_test_decoder(registry);
        media_library media;
        media.add("short.afq", {'A', 'F', 'Q', 'T', 0x44});
        decoder_feed feed(registry, media.opener());

        CHECK_THROWS_AS(feed.open("short.afq"), decoder_error);
    }

    TEST_CASE("should_describe_the_opened_track") {
        decoders_registry registry;
        register_test_decoder(registry);
        media_library media;
        media.add("tone.afq", make_test_track(48000, 2, 96000));
        decoder_feed feed(registry, media.opener());

        const auto info = feed.open("tone.afq");
        CHECK(feed.is_open());
        CHECK(feed.path() == "tone.afq");
        CHECK(info.sample_rate == 48000);
        CHECK(info.channels == 2);
        CHECK(info.bits_per_sample == 32);
        CHECK(info.duration == std::chrono::microseconds(2000000));
        CHECK(info.decoder_name == "Test Decoder");
        REQUIRE(info.tags.size() == 1);
        CHECK(info.tags[0].first == "title");
        CHECK(info.tags[0].second == TEST_TRACK_TITLE);

        std::ostringstream os;
        os << info;
        CHECK(os.str() == "48000 Hz, 2 ch, 32-bit float, Test Decoder");
    }

    TEST_CASE("should_read_whole_frames_until_the_end") {
        decoders_registry registry;
        register_test_decoder(registry);
        media_library media;
        media.add("t.afq", make_test_track(1000, 2, 25));
        decoder_feed feed(registry, media.opener());
        feed.open("t.afq");

        sample_buffer buf(21);
        auto n = feed.read_frames(buf, 100);
        // Capacity allows ten stereo frames
        CHECK(n == 10);
        CHECK(buf.frames == 10);
        CHECK(buf.length == 20);
        CHECK(buf.samples[0] == doctest::Approx(test_sample(0)));
        CHECK(buf.samples[19] == doctest::Approx(test_sample(9)));
        CHECK_FALSE(feed.at_end());

        n = feed.read_frames(buf, 10);
        CHECK(n == 10);
        CHECK(buf.samples[0] == doctest::Approx(test_sample(10)));

        n = feed.read_frames(buf, 10);
        CHECK(n == 5);
        CHECK(feed.at_end());
        CHECK(feed.frames_read() == 25);

        CHECK(feed.read_frames(buf, 10) == 0);
        CHECK(buf.length == 0);
    }

    TEST_CASE("should_surface_corrupt_data_as_decoder_error") {
        decoders_registry registry;
        register_test_decoder(registry);
        media_library media;
        media.add("bad.afq", make_test_track(1000, 1, 100, 15));
        decoder_feed feed(registry, media.opener());
        feed.open("bad.afq");

        sample_buffer buf(10);
        CHECK(feed.read_frames(buf, 10) == 10);
        // The next read hits the corrupt frame after five good ones
        CHECK_THROWS_AS(feed.read_frames(buf, 10), decoder_error);
    }

    TEST_CASE("should_reopen_another_track") {
        decoders_registry registry;
        register_test_decoder(registry);
        media_library media;
        media.add("a.afq", make_test_track(1000, 1, 5));
        media.add("b.afq", make_test_track(2000, 1, 5));
        decoder_feed feed(registry, media.opener());

        feed.open("a.afq");
        sample_buffer buf(16);
        CHECK(feed.read_frames(buf, 16) == 5);
        CHECK(feed.at_end());

        const auto info = feed.open("b.afq");
        CHECK(info.sample_rate == 2000);
        CHECK_FALSE(feed.at_end());
        CHECK(feed.frames_read() == 0);

        feed.close();
        CHECK_FALSE(feed.is_open());
        CHECK(feed.read_frames(buf, 16) == 0);
    }
}
