#ifndef AFQUEUE_RAW_TERMINAL_HH
#define AFQUEUE_RAW_TERMINAL_HH

#include <cstddef>
#include <optional>
#include <termios.h>

namespace afqueue {

    /**
     * @class raw_terminal
     * @brief Scoped raw mode on a terminal file descriptor
     *
     * While alive, input on @p fd is delivered byte by byte without echo,
     * keyboard signals (Ctrl-C, Ctrl-Z), flow control (Ctrl-S, Ctrl-Q),
     * literal quoting, CR to NL translation or output post-processing, and
     * the cursor is hidden. The saved mode is restored and the cursor shown
     * again by release(), by the destructor, and by the handlers this class
     * installs for fatal signals (SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGSEGV,
     * SIGBUS, SIGABRT), which then re-raise the signal. SIGINT still matters
     * with ISIG off: it can be sent by another process.
     *
     * Only one instance may exist at a time.
     */
    class raw_terminal {
        public:
            /**
             * @param fd Terminal to switch, usually STDIN_FILENO
             * @param out_fd Where cursor control sequences are written
             * @throws afqueue_error if @p fd is not a terminal or its mode cannot be changed
             */
            explicit raw_terminal(int fd, int out_fd);
            ~raw_terminal();

            raw_terminal(const raw_terminal&) = delete;
            raw_terminal& operator=(const raw_terminal&) = delete;

            /**
             * @brief Restore the saved mode now; later calls do nothing
             * @return false if the terminal refused the saved mode
             */
            bool release();

            [[nodiscard]] bool is_active() const;

            /**
             * @brief Apply the raw mode flag changes to a termios copy
             */
            static termios make_raw(const termios& original);

            static bool is_terminal(int fd);

        private:
            int m_fd;
            int m_out_fd;
            termios m_saved{};
            bool m_active = false;
    };

    /**
     * @class resize_watch
     * @brief Scoped SIGWINCH handler that records terminal size changes
     *
     * The handler only sets a flag; take() reads and clears it so the UI
     * thread can re-query the size at its own pace. Only one instance may
     * exist at a time.
     */
    class resize_watch {
        public:
            resize_watch();
            ~resize_watch();

            resize_watch(const resize_watch&) = delete;
            resize_watch& operator=(const resize_watch&) = delete;

            /// True once per burst of SIGWINCH since the previous call
            bool take();

            /// Width of the terminal on @p fd, nullopt if it is not a terminal
            static std::optional<std::size_t> columns(int fd);
    };

} // namespace afqueue

#endif
