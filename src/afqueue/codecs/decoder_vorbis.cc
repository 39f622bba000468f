#include <afqueue/codecs/decoder_vorbis.hh>
#include <afqueue/error.hh>
#include <failsafe/failsafe.hh>

#include "vorbis_comments.hh"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#define STB_VORBIS_NO_STDIO
#include <stb_vorbis.c>

namespace chrono = std::chrono;

namespace afqueue {
    struct decoder_vorbis::impl {
        stb_vorbis* m_vorbis = nullptr;
        // stb_vorbis decodes from memory, so the whole file is kept resident
        std::vector <unsigned char> m_data;
        int m_channels = 0;
        unsigned int m_sample_rate = 0;
        unsigned int m_total_samples = 0;
        decoder::metadata_t m_tags;

        ~impl() {
            if (m_vorbis) {
                stb_vorbis_close(m_vorbis);
            }
        }

        void load_from_stream(io_stream* rwops) {
            const auto start = rwops->tell();
            const auto file_size = rwops->get_size();
            if (start < 0 || file_size <= start) {
                throw decoder_error("Ogg Vorbis stream has no data");
            }

            m_data.resize(static_cast <size_t>(file_size - start));
            if (rwops->read(m_data.data(), m_data.size()) != m_data.size()) {
                throw io_error("short read while loading Ogg Vorbis stream");
            }

            int error = 0;
            m_vorbis = stb_vorbis_open_memory(m_data.data(), static_cast <int>(m_data.size()), &error, nullptr);
            if (!m_vorbis) {
                throw decoder_error("stb_vorbis_open_memory failed, error code " + std::to_string(error));
            }

            const stb_vorbis_info info = stb_vorbis_get_info(m_vorbis);
            m_channels = info.channels;
            m_sample_rate = info.sample_rate;
            m_total_samples = stb_vorbis_stream_length_in_samples(m_vorbis);
            if (m_channels <= 0 || m_sample_rate == 0) {
                throw decoder_error("Ogg Vorbis stream declares no channels or a zero sample rate");
            }

            const stb_vorbis_comment comments = stb_vorbis_get_comment(m_vorbis);
            for (int i = 0; i < comments.comment_list_length; i++) {
                const char* text = comments.comment_list[i];
                if (text) {
                    codecs::add_vorbis_comment(m_tags, text, std::strlen(text));
                }
            }
        }
    };

    decoder_vorbis::decoder_vorbis()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_vorbis::~decoder_vorbis() = default;

    bool decoder_vorbis::accept(io_stream* rwops) {
        if (!rwops) {
            return false;
        }
        // Ogg page capture pattern, then the Vorbis identification header
        unsigned char page[27] = {};
        if (rwops->read(page, sizeof(page)) != sizeof(page)) {
            return false;
        }
        if (page[0] != 'O' || page[1] != 'g' || page[2] != 'g' || page[3] != 'S') {
            return false;
        }
        const auto segments = static_cast <int64_t>(page[26]);
        if (rwops->seek(segments, seek_origin::cur) < 0) {
            return false;
        }
        unsigned char packet[7] = {};
        if (rwops->read(packet, sizeof(packet)) != sizeof(packet)) {
            return false;
        }
        static const char vorbis_id[] = "vorbis";
        if (packet[0] != 0x01) {
            return false;
        }
        for (size_t i = 0; i < 6; i++) {
            if (packet[1 + i] != static_cast <unsigned char>(vorbis_id[i])) {
                return false;
            }
        }
        return true;
    }

    const char* decoder_vorbis::get_name() const {
        return "Ogg Vorbis (stb_vorbis)";
    }

    void decoder_vorbis::open(io_stream* rwops) {
        if (is_open()) {
            return;
        }
        if (!rwops) {
            throw decoder_error("stb_vorbis open called without a stream");
        }
        m_pimpl->load_from_stream(rwops);
        LOG_DEBUG("codecs", "stb_vorbis: ", m_pimpl->m_channels, " channels, ",
                  m_pimpl->m_sample_rate, " Hz, ", m_pimpl->m_total_samples, " frames");
        set_is_open(true);
    }

    decoder::metadata_t decoder_vorbis::get_metadata() const {
        return m_pimpl->m_tags;
    }

    channels_t decoder_vorbis::get_channels() const {
        return static_cast <channels_t>(m_pimpl->m_channels);
    }

    sample_rate_t decoder_vorbis::get_rate() const {
        return static_cast <sample_rate_t>(m_pimpl->m_sample_rate);
    }

    chrono::microseconds decoder_vorbis::duration() const {
        if (!is_open() || m_pimpl->m_total_samples == 0) {
            return {};
        }
        return chrono::duration_cast <chrono::microseconds>(
            chrono::duration <double>(static_cast <double>(m_pimpl->m_total_samples) / m_pimpl->m_sample_rate));
    }

    size_t decoder_vorbis::do_decode(float buf[], size_t len, bool& call_again) {
        if (!is_open() || !m_pimpl->m_vorbis) {
            call_again = false;
            return 0;
        }

        const auto frames_requested = static_cast <int>(len / static_cast <size_t>(m_pimpl->m_channels));
        // Returns frames per channel, not samples
        const int frames = stb_vorbis_get_samples_float_interleaved(
            m_pimpl->m_vorbis, m_pimpl->m_channels, buf, static_cast <int>(len));

        call_again = frames > 0 && frames == frames_requested;
        return static_cast <size_t>(frames > 0 ? frames : 0) * static_cast <size_t>(m_pimpl->m_channels);
    }
}
