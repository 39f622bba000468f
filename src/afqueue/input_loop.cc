#include <afqueue/input_loop.hh>
#include <afqueue/command_channel.hh>
#include <failsafe/failsafe.hh>

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace afqueue {

std::optional<command_type> map_key(char key) {
    switch (key) {
        case 'n': return command_type::skip;
        case 'p': return command_type::toggle_pause;
        case ']': return command_type::volume_up;
        case '[': return command_type::volume_down;
        case 'q': return command_type::exit;
        default: return std::nullopt;
    }
}

input_loop::input_loop(int fd, command_channel& channel, std::chrono::milliseconds poll_timeout)
    : m_fd(fd), m_channel(channel), m_poll_timeout(poll_timeout) {
}

input_loop::~input_loop() {
    stop();
}

void input_loop::start() {
    if (m_thread.joinable()) {
        return;
    }
    m_stop = false;
    m_running = true;
    m_thread = std::thread([this] { run(); });
}

void input_loop::stop() {
    m_stop = true;
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool input_loop::is_running() const {
    return m_running;
}

void input_loop::run() {
    pollfd pfd{};
    pfd.fd = m_fd;
    pfd.events = POLLIN;

    while (!m_stop) {
        const int ready = ::poll(&pfd, 1, static_cast<int>(m_poll_timeout.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("terminal", "poll failed: ", std::strerror(errno));
            m_channel.push(command::make(command_type::exit));
            break;
        }
        if (ready == 0) {
            continue;
        }

        char key = 0;
        const auto n = ::read(m_fd, &key, 1);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG_ERROR("terminal", "read failed: ", std::strerror(errno));
            m_channel.push(command::make(command_type::exit));
            break;
        }
        if (n == 0) {
            LOG_INFO("terminal", "End of input");
            m_channel.push(command::make(command_type::exit));
            break;
        }

        if (const auto cmd = map_key(key)) {
            m_channel.push(command::make(*cmd));
        }
    }
    m_running = false;
}

} // namespace afqueue
