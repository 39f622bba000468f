/**
 * @file test_raw_terminal.cc
 * @brief Unit tests for raw mode flag handling and window size tracking
 *
 * Entering raw mode needs a terminal; a pseudo terminal stands in for it
 * and the raw mode is entered in a forked child so that the signal which
 * kills it cannot reach the test runner.
 */

#include <doctest/doctest.h>
#include <afqueue/raw_terminal.hh>
#include <afqueue/error.hh>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace afqueue;

namespace {
    // Slave side of a fresh pseudo terminal, -1 if none can be had
    struct pty_pair {
        int master = -1;
        int slave = -1;

        pty_pair() {
            master = ::posix_openpt(O_RDWR | O_NOCTTY);
            if (master < 0) {
                return;
            }
            if (::grantpt(master) != 0 || ::unlockpt(master) != 0) {
                return;
            }
            const char* name = ::ptsname(master);
            if (name) {
                slave = ::open(name, O_RDWR | O_NOCTTY);
            }
        }

        ~pty_pair() {
            if (slave >= 0) ::close(slave);
            if (master >= 0) ::close(master);
        }
    };
}

TEST_SUITE("RawTerminal::Unit") {

    TEST_CASE("should_clear_line_discipline_flags") {
        termios cooked;
        std::memset(&cooked, 0, sizeof(cooked));
        cooked.c_lflag = ECHO | ICANON | ISIG | IEXTEN | ECHOE;
        cooked.c_iflag = IXON | ICRNL | BRKINT | IGNPAR;
        cooked.c_oflag = OPOST;
        cooked.c_cc[VMIN] = 0;
        cooked.c_cc[VTIME] = 5;

        const termios raw = raw_terminal::make_raw(cooked);

        CHECK((raw.c_lflag & (ECHO | ICANON | ISIG | IEXTEN)) == 0);
        CHECK((raw.c_iflag & (IXON | ICRNL | BRKINT)) == 0);
        CHECK((raw.c_oflag & OPOST) == 0);
        CHECK(raw.c_cc[VMIN] == 1);
        CHECK(raw.c_cc[VTIME] == 0);
        // Unrelated flags survive
        CHECK((raw.c_lflag & ECHOE) != 0);
        CHECK((raw.c_iflag & IGNPAR) != 0);
    }

    TEST_CASE("should_refuse_non_terminals") {
        int fds[2];
        REQUIRE(::pipe(fds) == 0);

        CHECK_FALSE(raw_terminal::is_terminal(fds[0]));
        CHECK_THROWS_AS(raw_terminal(fds[0], fds[1]), afqueue_error);

        ::close(fds[0]);
        ::close(fds[1]);
    }

    TEST_CASE("should_restore_the_terminal_when_interrupted_by_a_signal") {
        pty_pair pty;
        if (pty.slave < 0) {
            MESSAGE("no pseudo terminal available");
            return;
        }

        termios before;
        REQUIRE(::tcgetattr(pty.slave, &before) == 0);
        REQUIRE((before.c_lflag & ICANON) != 0);

        const pid_t child = ::fork();
        REQUIRE(child >= 0);
        if (child == 0) {
            try {
                raw_terminal raw(pty.slave, pty.slave);
                ::raise(SIGINT);
            } catch (const std::exception&) {
                ::_exit(2);
            }
            ::_exit(3);
        }

        int status = 0;
        REQUIRE(::waitpid(child, &status, 0) == child);
        CHECK(WIFSIGNALED(status));
        CHECK(WTERMSIG(status) == SIGINT);

        termios after;
        REQUIRE(::tcgetattr(pty.slave, &after) == 0);
        CHECK(after.c_lflag == before.c_lflag);
        CHECK(after.c_iflag == before.c_iflag);
        CHECK(after.c_oflag == before.c_oflag);

        // The cursor was hidden and shown again
        REQUIRE(::fcntl(pty.master, F_SETFL, ::fcntl(pty.master, F_GETFL) | O_NONBLOCK) == 0);
        char echoed[64] = {};
        const auto n = ::read(pty.master, echoed, sizeof(echoed) - 1);
        REQUIRE(n > 0);
        CHECK(std::strstr(echoed, "\x1b[?25h") != nullptr);
    }

    TEST_CASE("should_flag_each_window_size_change_once") {
        resize_watch watch;
        CHECK_FALSE(watch.take());
        REQUIRE(::raise(SIGWINCH) == 0);
        CHECK(watch.take());
        CHECK_FALSE(watch.take());

        CHECK_THROWS_AS(resize_watch(), afqueue_error);
    }

    TEST_CASE("should_read_the_column_count_of_a_terminal") {
        pty_pair pty;
        if (pty.slave < 0) {
            MESSAGE("no pseudo terminal available");
            return;
        }
        winsize ws{};
        ws.ws_row = 30;
        ws.ws_col = 132;
        REQUIRE(::ioctl(pty.master, TIOCSWINSZ, &ws) == 0);
        CHECK(resize_watch::columns(pty.slave) == std::optional<std::size_t>(132));

        int pipe_fds[2];
        REQUIRE(::pipe(pipe_fds) == 0);
        CHECK_FALSE(resize_watch::columns(pipe_fds[0]).has_value());
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);
    }
}
