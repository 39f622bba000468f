#include <afqueue/codecs/decoder_drwav.hh>
#include <afqueue/error.hh>
#include <failsafe/failsafe.hh>

#include "stream_callbacks.hh"

#include <algorithm>
#include <string>

#define DR_WAV_NO_STDIO
#define DR_WAV_IMPLEMENTATION
#define DRWAV_API static
#define DRWAV_PRIVATE static
#include <dr_wav.h>

namespace chrono = std::chrono;

extern "C" {
static size_t drwav_read_callback(void* const rwops, void* const dst, const size_t len) {
    return afqueue::codecs::stream_read(rwops, dst, len);
}

static drwav_bool32 drwav_seek_callback(void* const rwops, const int offset, const drwav_seek_origin origin) {
    switch (origin) {
        case drwav_seek_origin_start:
            return afqueue::codecs::stream_seek(rwops, offset, false);
        case drwav_seek_origin_current:
            return afqueue::codecs::stream_seek(rwops, offset, true);
        default:
            return false;
    }
}
} // extern "C"

namespace afqueue {
    namespace {
        const char* info_tag_name(drwav_metadata_type type) {
            switch (type) {
                case drwav_metadata_type_list_info_title: return "title";
                case drwav_metadata_type_list_info_artist: return "artist";
                case drwav_metadata_type_list_info_album: return "album";
                case drwav_metadata_type_list_info_tracknumber: return "tracknumber";
                case drwav_metadata_type_list_info_date: return "date";
                case drwav_metadata_type_list_info_genre: return "genre";
                case drwav_metadata_type_list_info_comment: return "comment";
                case drwav_metadata_type_list_info_copyright: return "copyright";
                case drwav_metadata_type_list_info_software: return "software";
                default: return nullptr;
            }
        }
    }

    struct decoder_drwav::impl final {
        drwav m_handle{};
        bool m_eof = false;
        decoder::metadata_t m_tags;

        // LIST/INFO text chunks; the metadata array is freed with the handle
        void collect_tags() {
            for (drwav_uint32 i = 0; i < m_handle.metadataCount; i++) {
                const drwav_metadata& meta = m_handle.pMetadata[i];
                const char* name = info_tag_name(meta.type);
                if (!name || !meta.data.infoText.pString) {
                    continue;
                }
                // INFO strings are usually stored with their terminator
                std::string value(meta.data.infoText.pString, meta.data.infoText.stringLength);
                value.erase(std::find(value.begin(), value.end(), '\0'), value.end());
                m_tags.emplace_back(name, std::move(value));
            }
        }
    };

    decoder_drwav::decoder_drwav()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_drwav::~decoder_drwav() {
        if (!is_open()) {
            return;
        }
        drwav_uninit(&m_pimpl->m_handle);
    }

    bool decoder_drwav::accept(io_stream* rwops) {
        if (!rwops) {
            return false;
        }
        drwav header;
        if (!drwav_init(&header, drwav_read_callback, drwav_seek_callback, rwops, nullptr)) {
            return false;
        }
        const bool usable = header.channels > 0 && header.sampleRate > 0;
        drwav_uninit(&header);
        return usable;
    }

    const char* decoder_drwav::get_name() const {
        return "WAV (dr_wav)";
    }

    void decoder_drwav::open(io_stream* const rwops) {
        if (is_open()) {
            return;
        }
        if (!rwops || !drwav_init_with_metadata(&m_pimpl->m_handle, drwav_read_callback, drwav_seek_callback,
                                                rwops, 0, nullptr)) {
            throw decoder_error("drwav_init_with_metadata failed");
        }
        if (m_pimpl->m_handle.channels == 0 || m_pimpl->m_handle.sampleRate == 0) {
            drwav_uninit(&m_pimpl->m_handle);
            throw decoder_error("WAV header declares no channels or a zero sample rate");
        }
        m_pimpl->collect_tags();
        LOG_DEBUG("codecs", "dr_wav: ", m_pimpl->m_handle.channels, " channels, ",
                  m_pimpl->m_handle.sampleRate, " Hz, ", m_pimpl->m_handle.totalPCMFrameCount, " frames");
        set_is_open(true);
    }

    size_t decoder_drwav::do_decode(float* const buf, size_t len, bool& call_again) {
        if (m_pimpl->m_eof || !is_open()) {
            call_again = false;
            return 0;
        }

        const auto ret =
            drwav_read_pcm_frames_f32(&m_pimpl->m_handle, len / get_channels(), buf) * get_channels();
        if (ret < static_cast <drwav_uint64>(len)) {
            m_pimpl->m_eof = true;
            call_again = false;
        } else {
            call_again = true;
        }
        return static_cast <size_t>(ret);
    }

    decoder::metadata_t decoder_drwav::get_metadata() const {
        return m_pimpl->m_tags;
    }

    channels_t decoder_drwav::get_channels() const {
        return static_cast <channels_t>(m_pimpl->m_handle.channels);
    }

    sample_rate_t decoder_drwav::get_rate() const {
        return m_pimpl->m_handle.sampleRate;
    }

    chrono::microseconds decoder_drwav::duration() const {
        if (!is_open()) {
            return {};
        }
        return chrono::duration_cast <chrono::microseconds>(
            chrono::duration <double>(static_cast <double>(m_pimpl->m_handle.totalPCMFrameCount) / get_rate()));
    }
}
