#include <afqueue/codecs/decoder_drflac.hh>
#include <afqueue/error.hh>
#include <failsafe/failsafe.hh>

#include "stream_callbacks.hh"
#include "vorbis_comments.hh"

#define DR_FLAC_NO_STDIO
#define DR_FLAC_IMPLEMENTATION
#define DRFLAC_API static
#define DRFLAC_PRIVATE static
#include <dr_flac.h>

namespace chrono = std::chrono;

namespace {
    // dr_flac hands one user pointer to the read, seek and metadata callbacks
    struct flac_source {
        afqueue::io_stream* stream = nullptr;
        afqueue::decoder::metadata_t* tags = nullptr;
    };
}

extern "C" {
static size_t drflac_read_callback(void* const user, void* const dst, const size_t len) {
    return afqueue::codecs::stream_read(static_cast <flac_source*>(user)->stream, dst, len);
}

static drflac_bool32 drflac_seek_callback(void* const user, const int offset, const drflac_seek_origin origin) {
    auto* const rwops = static_cast <flac_source*>(user)->stream;
    switch (origin) {
        case drflac_seek_origin_start:
            return afqueue::codecs::stream_seek(rwops, offset, false);
        case drflac_seek_origin_current:
            return afqueue::codecs::stream_seek(rwops, offset, true);
        default:
            return false;
    }
}

static void drflac_meta_callback(void* const user, drflac_metadata* const meta) {
    auto* const tags = static_cast <flac_source*>(user)->tags;
    if (!tags || !meta || meta->type != DRFLAC_METADATA_BLOCK_TYPE_VORBIS_COMMENT) {
        return;
    }
    drflac_vorbis_comment_iterator it;
    drflac_init_vorbis_comment_iterator(&it, meta->data.vorbis_comment.commentCount,
                                        meta->data.vorbis_comment.pComments);
    drflac_uint32 len = 0;
    while (const char* comment = drflac_next_vorbis_comment(&it, &len)) {
        afqueue::codecs::add_vorbis_comment(*tags, comment, len);
    }
}
} // extern "C"

namespace afqueue {
    struct decoder_drflac::impl final {
        // Must outlive the handle; dr_flac keeps the pointer for later reads
        flac_source m_source;
        metadata_t m_tags;
        std::unique_ptr <drflac, decltype(&drflac_close)> m_handle{nullptr, drflac_close};
        bool m_eof = false;
    };

    decoder_drflac::decoder_drflac()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder_drflac::~decoder_drflac() = default;

    bool decoder_drflac::accept(io_stream* rwops) {
        if (!rwops) {
            return false;
        }
        char magic[4] = {};
        if (rwops->read(magic, sizeof(magic)) != sizeof(magic)) {
            return false;
        }
        return magic[0] == 'f' && magic[1] == 'L' && magic[2] == 'a' && magic[3] == 'C';
    }

    const char* decoder_drflac::get_name() const {
        return "FLAC (dr_flac)";
    }

    void decoder_drflac::open(io_stream* const rwops) {
        if (is_open()) {
            return;
        }
        if (!rwops) {
            throw decoder_error("drflac_open called without a stream");
        }
        m_pimpl->m_source = flac_source{rwops, &m_pimpl->m_tags};
        m_pimpl->m_handle = {drflac_open_with_metadata(drflac_read_callback, drflac_seek_callback,
                                                       drflac_meta_callback, &m_pimpl->m_source, nullptr),
                             drflac_close};
        if (!m_pimpl->m_handle) {
            throw decoder_error("drflac_open failed");
        }
        if (m_pimpl->m_handle->channels == 0 || m_pimpl->m_handle->sampleRate == 0) {
            m_pimpl->m_handle.reset();
            throw decoder_error("FLAC stream info declares no channels or a zero sample rate");
        }
        LOG_DEBUG("codecs", "dr_flac: ", m_pimpl->m_handle->channels, " channels, ",
                  m_pimpl->m_handle->sampleRate, " Hz, ", m_pimpl->m_handle->totalPCMFrameCount, " frames");
        set_is_open(true);
    }

    size_t decoder_drflac::do_decode(float* const buf, size_t len, bool& call_again) {
        if (m_pimpl->m_eof || !is_open()) {
            call_again = false;
            return 0;
        }

        const auto ret =
            drflac_read_pcm_frames_f32(m_pimpl->m_handle.get(), len / get_channels(), buf) * get_channels();
        if (ret < static_cast <drflac_uint64>(len)) {
            m_pimpl->m_eof = true;
            call_again = false;
        } else {
            call_again = true;
        }
        return static_cast <size_t>(ret);
    }

    decoder::metadata_t decoder_drflac::get_metadata() const {
        return m_pimpl->m_tags;
    }

    channels_t decoder_drflac::get_channels() const {
        return m_pimpl->m_handle ? static_cast <channels_t>(m_pimpl->m_handle->channels) : 0;
    }

    sample_rate_t decoder_drflac::get_rate() const {
        return m_pimpl->m_handle ? m_pimpl->m_handle->sampleRate : 0;
    }

    chrono::microseconds decoder_drflac::duration() const {
        if (!is_open() || m_pimpl->m_handle->totalPCMFrameCount == 0) {
            return {};
        }
        return chrono::duration_cast <chrono::microseconds>(
            chrono::duration <double>(static_cast <double>(m_pimpl->m_handle->totalPCMFrameCount) / get_rate()));
    }
}
