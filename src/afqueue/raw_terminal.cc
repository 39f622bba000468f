#include <afqueue/raw_terminal.hh>
#include <afqueue/error.hh>
#include <failsafe/failsafe.hh>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

namespace afqueue {

namespace {
    constexpr char HIDE_CURSOR[] = "\x1b[?25l";
    constexpr char SHOW_CURSOR[] = "\x1b[?25h";

    constexpr int FATAL_SIGNALS[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGSEGV, SIGBUS, SIGABRT};
    constexpr std::size_t NUM_FATAL_SIGNALS = sizeof(FATAL_SIGNALS) / sizeof(FATAL_SIGNALS[0]);

    // Read by the signal handler; only plain data
    termios g_saved_mode;
    int g_fd = -1;
    int g_out_fd = -1;
    std::atomic<bool> g_armed{false};
    struct sigaction g_previous[NUM_FATAL_SIGNALS];

    void write_all(int fd, const char* s, std::size_t len) {
        while (len > 0) {
            const auto n = ::write(fd, s, len);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return;
            }
            s += n;
            len -= static_cast<std::size_t>(n);
        }
    }

    void restore_on_signal(int sig) {
        if (g_armed.exchange(false)) {
            ::tcsetattr(g_fd, TCSAFLUSH, &g_saved_mode);
            write_all(g_out_fd, SHOW_CURSOR, sizeof(SHOW_CURSOR) - 1);
        }
        ::signal(sig, SIG_DFL);
        ::raise(sig);
    }

    void install_handlers() {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = restore_on_signal;
        sigemptyset(&sa.sa_mask);
        for (std::size_t i = 0; i < NUM_FATAL_SIGNALS; i++) {
            ::sigaction(FATAL_SIGNALS[i], &sa, &g_previous[i]);
        }
    }

    void remove_handlers() {
        for (std::size_t i = 0; i < NUM_FATAL_SIGNALS; i++) {
            ::sigaction(FATAL_SIGNALS[i], &g_previous[i], nullptr);
        }
    }

    volatile std::sig_atomic_t g_resized = 0;
    std::atomic<bool> g_watching{false};
    struct sigaction g_previous_winch;

    void note_resize(int) {
        g_resized = 1;
    }
}

termios raw_terminal::make_raw(const termios& original) {
    termios t = original;
    t.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | ISIG | IEXTEN);
    t.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL | BRKINT);
    t.c_oflag &= ~static_cast<tcflag_t>(OPOST);
    t.c_cc[VMIN] = 1;
    t.c_cc[VTIME] = 0;
    return t;
}

bool raw_terminal::is_terminal(int fd) {
    return ::isatty(fd) == 1;
}

raw_terminal::raw_terminal(int fd, int out_fd)
    : m_fd(fd), m_out_fd(out_fd) {
    if (g_armed.load()) {
        throw afqueue_error("raw mode is already active");
    }
    if (!is_terminal(fd)) {
        throw afqueue_error("not a terminal: fd " + std::to_string(fd));
    }
    if (::tcgetattr(fd, &m_saved) != 0) {
        THROW_RUNTIME(std::string("tcgetattr failed: ") + std::strerror(errno));
    }

    g_saved_mode = m_saved;
    g_fd = fd;
    g_out_fd = out_fd;
    install_handlers();
    g_armed.store(true);

    const termios raw = make_raw(m_saved);
    if (::tcsetattr(fd, TCSAFLUSH, &raw) != 0) {
        const int err = errno;
        g_armed.store(false);
        remove_handlers();
        THROW_RUNTIME(std::string("tcsetattr failed: ") + std::strerror(err));
    }
    m_active = true;
    write_all(m_out_fd, HIDE_CURSOR, sizeof(HIDE_CURSOR) - 1);
    LOG_DEBUG("terminal", "Raw mode enabled on fd ", fd);
}

raw_terminal::~raw_terminal() {
    if (!release()) {
        LOG_ERROR("terminal", "Failed to restore terminal mode: ", std::strerror(errno));
    }
}

bool raw_terminal::release() {
    if (!m_active) {
        return true;
    }
    m_active = false;
    g_armed.store(false);
    remove_handlers();

    const bool ok = ::tcsetattr(m_fd, TCSAFLUSH, &m_saved) == 0;
    write_all(m_out_fd, SHOW_CURSOR, sizeof(SHOW_CURSOR) - 1);
    LOG_DEBUG("terminal", "Raw mode released");
    return ok;
}

bool raw_terminal::is_active() const {
    return m_active;
}

resize_watch::resize_watch() {
    if (g_watching.exchange(true)) {
        throw afqueue_error("a resize watch is already installed");
    }
    g_resized = 0;
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = note_resize;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    if (::sigaction(SIGWINCH, &sa, &g_previous_winch) != 0) {
        const int err = errno;
        g_watching.store(false);
        THROW_RUNTIME(std::string("sigaction(SIGWINCH) failed: ") + std::strerror(err));
    }
}

resize_watch::~resize_watch() {
    ::sigaction(SIGWINCH, &g_previous_winch, nullptr);
    g_watching.store(false);
}

bool resize_watch::take() {
    if (!g_resized) {
        return false;
    }
    g_resized = 0;
    return true;
}

std::optional<std::size_t> resize_watch::columns(int fd) {
    winsize ws{};
    if (::ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return static_cast<std::size_t>(ws.ws_col);
    }
    return std::nullopt;
}

} // namespace afqueue
