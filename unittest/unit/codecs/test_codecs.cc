/**
 * @file test_codecs.cc
 * @brief Detection and decoding through the built-in codec set
 *
 * WAV data is synthesised in memory; the other formats are covered for
 * detection only.
 */

#include <doctest/doctest.h>
#include <afqueue/codecs/register_codecs.hh>
#include <afqueue/codecs/decoder_drwav.hh>
#include <afqueue/codecs/decoder_drflac.hh>
#include <afqueue/codecs/decoder_vorbis.hh>
#include <afqueue/sdk/decoders_registry.hh>
#include <afqueue/error.hh>
#include "../../mock_components.hh"
#include "vorbis_comments.hh"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace afqueue;
using namespace afqueue::test;

namespace {
    void put_u16(std::vector<uint8_t>& out, uint16_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>(v >> 8));
    }

    void put_tag(std::vector<uint8_t>& out, const char* tag) {
        out.insert(out.end(), tag, tag + 4);
    }

    // LIST/INFO chunk with NUL-terminated, even-padded strings
    std::vector<uint8_t> make_info_list(const std::vector<std::pair<const char*, std::string>>& entries) {
        std::vector<uint8_t> body;
        put_tag(body, "INFO");
        for (const auto& entry : entries) {
            const auto size = static_cast<uint32_t>(entry.second.size() + 1);
            put_tag(body, entry.first);
            put_u32(body, size);
            body.insert(body.end(), entry.second.begin(), entry.second.end());
            body.push_back(0);
            if (size % 2 != 0) {
                body.push_back(0);
            }
        }
        std::vector<uint8_t> out;
        put_tag(out, "LIST");
        put_u32(out, static_cast<uint32_t>(body.size()));
        out.insert(out.end(), body.begin(), body.end());
        return out;
    }

    // 16-bit PCM WAV, with @p extra chunks between "fmt " and "data"
    std::vector<uint8_t> make_wav(uint32_t rate, uint16_t channels, const std::vector<int16_t>& samples,
                                  const std::vector<uint8_t>& extra = {}) {
        const auto data_bytes = static_cast<uint32_t>(samples.size() * 2);
        std::vector<uint8_t> out;
        put_tag(out, "RIFF");
        put_u32(out, 36 + static_cast<uint32_t>(extra.size()) + data_bytes);
        put_tag(out, "WAVE");
        put_tag(out, "fmt ");
        put_u32(out, 16);
        put_u16(out, 1);
        put_u16(out, channels);
        put_u32(out, rate);
        put_u32(out, rate * channels * 2);
        put_u16(out, static_cast<uint16_t>(channels * 2));
        put_u16(out, 16);
        out.insert(out.end(), extra.begin(), extra.end());
        put_tag(out, "data");
        put_u32(out, data_bytes);
        for (auto s : samples) {
            put_u16(out, static_cast<uint16_t>(s));
        }
        return out;
    }
}

TEST_SUITE("Codecs::Integration") {

    TEST_CASE("should_register_the_built_in_decoders") {
        auto registry = create_registry_with_all_codecs();
        REQUIRE(registry);
        CHECK(registry->size() == 4);
    }

    TEST_CASE("should_decode_pcm_wav") {
        const std::vector<int16_t> samples = {0, 16384, -16384, 32767, -32768, 8192};
        memory_io_stream stream(make_wav(22050, 2, samples));

        auto registry = create_registry_with_all_codecs();
        auto dec = registry->find_decoder(&stream);
        REQUIRE(dec);
        CHECK(std::string(dec->get_name()) == "WAV (dr_wav)");

        dec->open(&stream);
        CHECK(dec->get_rate() == 22050);
        CHECK(dec->get_channels() == 2);
        CHECK(dec->duration().count() > 0);

        float out[8] = {};
        bool again = true;
        const auto n = dec->decode(out, 8, again);
        CHECK(n == 6);
        CHECK_FALSE(again);
        CHECK(out[0] == doctest::Approx(0.0f));
        CHECK(out[1] == doctest::Approx(0.5f));
        CHECK(out[2] == doctest::Approx(-0.5f));
        CHECK(out[4] == doctest::Approx(-1.0f));
    }

    TEST_CASE("should_read_wav_info_tags") {
        const auto info = make_info_list({{"INAM", "Night Drive"}, {"IART", "Low Tide"}});
        memory_io_stream stream(make_wav(44100, 1, {0, 100, -100, 0}, info));

        decoder_drwav dec;
        dec.open(&stream);
        const auto tags = dec.get_metadata();
        REQUIRE(tags.size() == 2);
        CHECK(tags[0].first == "title");
        CHECK(tags[0].second == "Night Drive");
        CHECK(tags[1].first == "artist");
        CHECK(tags[1].second == "Low Tide");

        float out[4] = {};
        bool again = true;
        CHECK(dec.decode(out, 4, again) == 4);
        CHECK(out[1] == doctest::Approx(100.0f / 32768.0f));
    }

    TEST_CASE("should_report_no_tags_for_plain_wav") {
        memory_io_stream stream(make_wav(8000, 1, {1, 2}));
        decoder_drwav dec;
        dec.open(&stream);
        CHECK(dec.get_metadata().empty());
    }

    TEST_CASE("should_split_vorbis_comments") {
        decoder::metadata_t tags;
        const std::string title = "TITLE=a=b";
        codecs::add_vorbis_comment(tags, title.data(), title.size());
        codecs::add_vorbis_comment(tags, "=orphan", 7);
        codecs::add_vorbis_comment(tags, "noequals", 8);
        codecs::add_vorbis_comment(tags, "Artist=Someone", 14);
        REQUIRE(tags.size() == 2);
        CHECK(tags[0] == std::make_pair(std::string("title"), std::string("a=b")));
        CHECK(tags[1] == std::make_pair(std::string("artist"), std::string("Someone")));
    }

    TEST_CASE("should_reject_malformed_wav_headers") {
        auto bytes = make_wav(44100, 1, {1, 2, 3});
        bytes[8] = 'X';
        memory_io_stream stream(bytes);
        CHECK_FALSE(decoder_drwav::accept(&stream));

        stream.seek(0, seek_origin::set);
        decoder_drwav dec;
        CHECK_THROWS_AS(dec.open(&stream), decoder_error);
    }

    TEST_CASE("should_detect_containers_by_signature") {
        memory_io_stream flac(std::vector<uint8_t>{'f', 'L', 'a', 'C', 0, 0, 0, 34});
        CHECK(decoder_drflac::accept(&flac));

        std::vector<uint8_t> ogg = {'O', 'g', 'g', 'S', 0, 2};
        ogg.resize(26, 0);
        ogg.push_back(1);      // one segment
        ogg.push_back(30);     // of 30 bytes
        const char id[] = "\x01vorbis";
        ogg.insert(ogg.end(), id, id + 7);
        memory_io_stream vorbis(ogg);
        CHECK(decoder_vorbis::accept(&vorbis));

        memory_io_stream not_vorbis(std::vector<uint8_t>{'O', 'g', 'g', 'S', 0, 2, 0, 0});
        CHECK_FALSE(decoder_vorbis::accept(&not_vorbis));
    }

    TEST_CASE("should_not_claim_arbitrary_bytes") {
        auto registry = create_registry_with_all_codecs();
        std::vector<uint8_t> junk(4096);
        for (size_t i = 0; i < junk.size(); i++) {
            junk[i] = static_cast<uint8_t>('a' + i % 26);
        }
        memory_io_stream stream(junk);
        CHECK_FALSE(registry->can_decode(&stream));
    }
}
