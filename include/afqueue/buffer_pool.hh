#ifndef AFQUEUE_BUFFER_POOL_HH
#define AFQUEUE_BUFFER_POOL_HH

#include <afqueue/sample_buffer.hh>
#include <memory>
#include <optional>
#include <vector>

namespace afqueue {

    /**
     * @class buffer_pool
     * @brief Fixed set of sample buffers allocated up front
     *
     * All memory is allocated in the constructor; nothing in the pool grows
     * afterwards. Slots are addressed by index and change hands through
     * compare-and-swap on their state, so the pool itself needs no lock.
     */
    class buffer_pool {
        public:
            /**
             * @param count Number of slots, at least 2
             * @param capacity Samples per slot
             * @throws config_error on a count below 2 or a zero capacity
             */
            buffer_pool(std::size_t count, std::size_t capacity);

            buffer_pool(const buffer_pool&) = delete;
            buffer_pool& operator=(const buffer_pool&) = delete;

            [[nodiscard]] std::size_t size() const noexcept;
            [[nodiscard]] std::size_t capacity() const noexcept;

            sample_buffer& operator[](std::size_t index) noexcept;
            const sample_buffer& operator[](std::size_t index) const noexcept;

            /**
             * @brief Atomically move a slot from @p from to @p to
             * @return false if the slot was not in @p from
             */
            bool transition(std::size_t index, buffer_state from, buffer_state to) noexcept;

            /**
             * @brief Claim the first free slot for filling
             */
            std::optional<std::size_t> acquire_free() noexcept;

            /**
             * @brief Filled slot of @p epoch with the lowest sequence number
             *
             * Does not claim the slot; use transition() to do so.
             */
            [[nodiscard]] std::optional<std::size_t> oldest_filled(epoch_t epoch) const noexcept;

            [[nodiscard]] std::size_t count(buffer_state s) const noexcept;

            /**
             * @brief Mark every slot free
             *
             * Only valid while no other thread uses the pool.
             */
            void reset_all() noexcept;

        private:
            std::vector<std::unique_ptr<sample_buffer>> m_buffers;
            std::size_t m_capacity;
    };

} // namespace afqueue

#endif
