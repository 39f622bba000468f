#ifndef AFQUEUE_SAMPLE_BUFFER_HH
#define AFQUEUE_SAMPLE_BUFFER_HH

#include <afqueue/sdk/buffer.hh>
#include <afqueue/sdk/types.hh>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iosfwd>

namespace afqueue {

    /**
     * @brief Lifecycle of a pool slot
     *
     * free -> filling -> filled -> playing -> consumed -> free.
     * A flush returns filled and consumed slots to free directly.
     */
    enum class buffer_state : uint8_t {
        free,
        filling,
        filled,
        playing,
        consumed
    };

    std::ostream& operator<<(std::ostream& os, buffer_state s);

    /**
     * @brief One slot of the buffer pool
     *
     * The payload fields are written by whoever moved the slot into filling
     * and published by the release store of filled. Readers must load
     * @ref state with acquire before touching them. The epoch and sequence
     * tags are atomic because the render path compares them before it owns
     * the slot.
     */
    struct sample_buffer {
        explicit sample_buffer(std::size_t capacity)
            : samples(capacity) {}

        sample_buffer(const sample_buffer&) = delete;
        sample_buffer& operator=(const sample_buffer&) = delete;

        [[nodiscard]] std::size_t capacity() const noexcept {
            return samples.size();
        }

        buffer<float> samples;
        /// Valid interleaved samples in @ref samples
        std::size_t length = 0;
        std::size_t frames = 0;
        /// Epoch the contents were decoded for
        std::atomic<epoch_t> epoch{0};
        /// Fill order within an epoch
        std::atomic<uint64_t> sequence{0};
        std::atomic<buffer_state> state{buffer_state::free};
    };

} // namespace afqueue

#endif
