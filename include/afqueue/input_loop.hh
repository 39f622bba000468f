#ifndef AFQUEUE_INPUT_LOOP_HH
#define AFQUEUE_INPUT_LOOP_HH

#include <afqueue/command.hh>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

namespace afqueue {

    class command_channel;

    /**
     * @brief Key bindings
     *
     * | key | command      |
     * |-----|--------------|
     * | n   | skip         |
     * | p   | toggle_pause |
     * | ]   | volume_up    |
     * | [   | volume_down  |
     * | q   | exit         |
     *
     * @return The bound command, nothing for any other key
     */
    std::optional<command_type> map_key(char key);

    /**
     * @class input_loop
     * @brief Thread turning key presses into commands
     *
     * Reads one byte at a time from @p fd, polling with a short timeout so
     * that stop() takes effect promptly. End of input, or a read error,
     * pushes an exit command and ends the loop.
     */
    class input_loop {
        public:
            input_loop(int fd, command_channel& channel,
                       std::chrono::milliseconds poll_timeout = std::chrono::milliseconds(100));
            ~input_loop();

            input_loop(const input_loop&) = delete;
            input_loop& operator=(const input_loop&) = delete;

            void start();
            void stop();

            [[nodiscard]] bool is_running() const;

        private:
            void run();

            int m_fd;
            command_channel& m_channel;
            std::chrono::milliseconds m_poll_timeout;
            std::atomic<bool> m_stop{false};
            std::atomic<bool> m_running{false};
            std::thread m_thread;
    };

} // namespace afqueue

#endif
