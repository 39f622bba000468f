#ifndef AFQUEUE_COMMAND_CHANNEL_HH
#define AFQUEUE_COMMAND_CHANNEL_HH

#include <afqueue/command.hh>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace afqueue {

    /**
     * @class command_channel
     * @brief Unbounded FIFO from the input and refill threads to the moderator
     *
     * Producers never block beyond the short queue lock. There is a single
     * consumer, which applies commands strictly in arrival order. The audio
     * render thread never pushes.
     */
    class command_channel {
        public:
            command_channel() = default;
            command_channel(const command_channel&) = delete;
            command_channel& operator=(const command_channel&) = delete;

            /**
             * @brief Enqueue a command
             * @return false if the channel is closed and the command was dropped
             */
            bool push(command cmd);

            /**
             * @brief Block until a command arrives
             * @return The command, or nothing once the channel is closed and drained
             */
            std::optional<command> pop();

            /**
             * @brief Wait at most @p timeout for a command
             */
            std::optional<command> pop_for(std::chrono::milliseconds timeout);

            std::optional<command> try_pop();

            /**
             * @brief Reject further pushes and wake all waiting consumers
             */
            void close();

            [[nodiscard]] bool is_closed() const;
            [[nodiscard]] std::size_t size() const;

        private:
            std::optional<command> take_locked();

            std::deque<command> m_queue;
            mutable std::mutex m_mutex;
            std::condition_variable m_cv;
            bool m_closed = false;
    };

} // namespace afqueue

#endif
