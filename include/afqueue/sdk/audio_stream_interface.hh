/**
 * @file audio_stream_interface.hh
 * @brief Backend stream abstraction
 * @ingroup sdk
 */

#ifndef AFQUEUE_AUDIO_STREAM_INTERFACE_HH
#define AFQUEUE_AUDIO_STREAM_INTERFACE_HH

#include <cstddef>
#include <cstdint>

namespace afqueue {

/**
 * @class audio_stream_interface
 * @brief A source format stream bound to an open device
 * @ingroup sdk
 *
 * Created by audio_backend::create_stream(). While bound and not paused the
 * backend pulls data through the callback given at creation, converting from
 * the stream format to the device format. Destroying the stream unbinds it;
 * no callback is running or will run once the destructor returns.
 */
class audio_stream_interface {
public:
    virtual ~audio_stream_interface() = default;

    /**
     * @brief Drop any converted data queued inside the backend
     */
    virtual void clear() = 0;

    virtual bool pause() = 0;

    virtual bool resume() = 0;

    [[nodiscard]] virtual bool is_paused() const = 0;

    virtual bool bind_to_device() = 0;

    virtual void unbind_from_device() = 0;
};

/**
 * @brief Split a request for @p bytes into pieces that fit a fixed buffer
 *
 * Calls @p piece with byte counts of at most @p capacity, each a whole
 * number of @p frame_bytes frames except possibly the last. Stops early
 * when @p piece returns false.
 *
 * @return Bytes handed to @p piece
 */
template <typename Fn>
std::size_t for_each_piece(std::size_t bytes, std::size_t capacity, std::size_t frame_bytes, Fn&& piece) {
    if (capacity == 0) {
        return 0;
    }
    std::size_t done = 0;
    while (done < bytes) {
        std::size_t chunk = bytes - done < capacity ? bytes - done : capacity;
        if (frame_bytes > 0 && chunk > frame_bytes) {
            chunk -= chunk % frame_bytes;
        }
        if (!piece(chunk)) {
            break;
        }
        done += chunk;
    }
    return done;
}

} // namespace afqueue

#endif // AFQUEUE_AUDIO_STREAM_INTERFACE_HH
