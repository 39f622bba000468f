#ifndef AFQUEUE_CODECS_STREAM_CALLBACKS_HH
#define AFQUEUE_CODECS_STREAM_CALLBACKS_HH

#include <afqueue/sdk/io_stream.hh>

#include <cstddef>
#include <cstdint>

// Read and seek adapters shared by the dr_libs decoders. Each decoder wraps
// these in callbacks with the exact signature its library expects.
namespace afqueue::codecs {
    inline size_t stream_read(void* user, void* dst, size_t len) {
        return static_cast <io_stream*>(user)->read(dst, len);
    }

    inline bool stream_seek(void* user, int offset, bool from_current) {
        auto* const rwops = static_cast <io_stream*>(user);
        const auto size = rwops->get_size();
        const auto cur_pos = rwops->tell();
        if (size < 0 || cur_pos < 0) {
            return false;
        }

        const auto target = static_cast <int64_t>(offset) + (from_current ? cur_pos : 0);
        if (target < 0 || target >= size) {
            return false;
        }
        return rwops->seek(target, seek_origin::set) >= 0;
    }
} // namespace afqueue::codecs

#endif
