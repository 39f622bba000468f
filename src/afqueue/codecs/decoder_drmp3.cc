#include <afqueue/codecs/decoder_drmp3.hh>
#include <afqueue/error.hh>
#include <failsafe/failsafe.hh>

#include "stream_callbacks.hh"

#define DRMP3_API static
#define DRMP3_PRIVATE static
#define DR_MP3_NO_STDIO
#define DR_MP3_IMPLEMENTATION
#include <dr_mp3.h>

namespace chrono = std::chrono;

extern "C" {
static size_t drmp3_read_callback(void* const rwops, void* const dst, const size_t len) {
    return afqueue::codecs::stream_read(rwops, dst, len);
}

static drmp3_bool32 drmp3_seek_callback(void* const rwops, const int offset, const drmp3_seek_origin origin) {
    switch (origin) {
        case drmp3_seek_origin_start:
            return afqueue::codecs::stream_seek(rwops, offset, false);
        case drmp3_seek_origin_current:
            return afqueue::codecs::stream_seek(rwops, offset, true);
        default:
            return false;
    }
}
} // extern "C"

namespace afqueue {
    namespace {
        // dr_mp3 will happily sync onto noise, so require either an ID3v2 tag
        // or a plausible MPEG audio frame header at the start of the stream.
        bool has_mp3_signature(io_stream* rwops) {
            unsigned char head[4] = {};
            if (rwops->read(head, sizeof(head)) != sizeof(head)) {
                return false;
            }
            if (head[0] == 'I' && head[1] == 'D' && head[2] == '3') {
                return true;
            }
            const bool frame_sync = head[0] == 0xFF && (head[1] & 0xE0) == 0xE0;
            const bool valid_layer = (head[1] & 0x06) != 0;
            const bool valid_bitrate = (head[2] & 0xF0) != 0xF0;
            const bool valid_rate = (head[2] & 0x0C) != 0x0C;
            return frame_sync && valid_layer && valid_bitrate && valid_rate;
        }
    }

    struct decoder_drmp3::impl final {
        drmp3 m_handle{};
        chrono::microseconds m_duration{};
        bool m_eof = false;
    };

    decoder_drmp3::decoder_drmp3()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_drmp3::~decoder_drmp3() {
        if (!is_open()) {
            return;
        }
        drmp3_uninit(&m_pimpl->m_handle);
    }

    bool decoder_drmp3::accept(io_stream* rwops) {
        if (!rwops) {
            return false;
        }
        const auto start = rwops->tell();
        if (start < 0 || !has_mp3_signature(rwops)) {
            return false;
        }
        if (rwops->seek(start, seek_origin::set) < 0) {
            return false;
        }

        drmp3 header;
        if (!drmp3_init(&header, drmp3_read_callback, drmp3_seek_callback, rwops, nullptr)) {
            return false;
        }
        const bool usable = header.channels > 0 && header.sampleRate > 0;
        drmp3_uninit(&header);
        return usable;
    }

    const char* decoder_drmp3::get_name() const {
        return "MP3 (dr_mp3)";
    }

    void decoder_drmp3::open(io_stream* const rwops) {
        if (is_open()) {
            return;
        }
        if (!rwops || !drmp3_init(&m_pimpl->m_handle, drmp3_read_callback, drmp3_seek_callback, rwops, nullptr)) {
            throw decoder_error("drmp3_init failed");
        }
        // Counting frames walks the whole stream, which needs a known size
        if (rwops->get_size() > 0 && m_pimpl->m_handle.sampleRate > 0) {
            const auto frames = drmp3_get_pcm_frame_count(&m_pimpl->m_handle);
            m_pimpl->m_duration = chrono::duration_cast <chrono::microseconds>(
                chrono::duration <double>(static_cast <double>(frames) / m_pimpl->m_handle.sampleRate));
        }
        LOG_DEBUG("codecs", "dr_mp3: ", m_pimpl->m_handle.channels, " channels, ",
                  m_pimpl->m_handle.sampleRate, " Hz");
        set_is_open(true);
    }

    size_t decoder_drmp3::do_decode(float* const buf, size_t len, bool& call_again) {
        if (m_pimpl->m_eof || !is_open()) {
            call_again = false;
            return 0;
        }

        const auto ret =
            drmp3_read_pcm_frames_f32(&m_pimpl->m_handle, len / get_channels(), buf) * get_channels();
        if (ret < static_cast <drmp3_uint64>(len)) {
            m_pimpl->m_eof = true;
            call_again = false;
        } else {
            call_again = true;
        }
        return static_cast <size_t>(ret);
    }

    channels_t decoder_drmp3::get_channels() const {
        return static_cast <channels_t>(m_pimpl->m_handle.channels);
    }

    sample_rate_t decoder_drmp3::get_rate() const {
        return m_pimpl->m_handle.sampleRate;
    }

    chrono::microseconds decoder_drmp3::duration() const {
        return m_pimpl->m_duration;
    }
}
