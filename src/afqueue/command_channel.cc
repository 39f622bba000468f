#include <afqueue/command_channel.hh>
#include <ostream>

namespace afqueue {

std::ostream& operator<<(std::ostream& os, command_type t) {
    switch (t) {
        case command_type::skip: return os << "skip";
        case command_type::toggle_pause: return os << "toggle_pause";
        case command_type::volume_up: return os << "volume_up";
        case command_type::volume_down: return os << "volume_down";
        case command_type::exit: return os << "exit";
        case command_type::track_finished: return os << "track_finished";
        case command_type::track_failed: return os << "track_failed";
    }
    return os << "unknown";
}

std::ostream& operator<<(std::ostream& os, const command& c) {
    os << c.type;
    if (c.is_engine_event()) {
        os << "(epoch=" << c.epoch;
        if (!c.reason.empty()) {
            os << ", " << c.reason;
        }
        os << ")";
    }
    return os;
}

bool command_channel::push(command cmd) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return false;
        }
        m_queue.push_back(std::move(cmd));
    }
    m_cv.notify_one();
    return true;
}

std::optional<command> command_channel::take_locked() {
    if (m_queue.empty()) {
        return std::nullopt;
    }
    command cmd = std::move(m_queue.front());
    m_queue.pop_front();
    return cmd;
}

std::optional<command> command_channel::pop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_queue.empty() || m_closed; });
    return take_locked();
}

std::optional<command> command_channel::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this] { return !m_queue.empty() || m_closed; });
    return take_locked();
}

std::optional<command> command_channel::try_pop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return take_locked();
}

void command_channel::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cv.notify_all();
}

bool command_channel::is_closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

std::size_t command_channel::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

} // namespace afqueue
