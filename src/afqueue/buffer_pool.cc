#include <afqueue/buffer_pool.hh>
#include <afqueue/error.hh>
#include <ostream>
#include <string>

namespace afqueue {

std::ostream& operator<<(std::ostream& os, buffer_state s) {
    switch (s) {
        case buffer_state::free: return os << "free";
        case buffer_state::filling: return os << "filling";
        case buffer_state::filled: return os << "filled";
        case buffer_state::playing: return os << "playing";
        case buffer_state::consumed: return os << "consumed";
    }
    return os << "unknown";
}

buffer_pool::buffer_pool(std::size_t count, std::size_t capacity)
    : m_capacity(capacity) {
    if (count < 2) {
        throw config_error("buffer pool needs at least 2 buffers, got " + std::to_string(count));
    }
    if (capacity == 0) {
        throw config_error("buffer pool capacity must be positive");
    }
    m_buffers.reserve(count);
    for (std::size_t i = 0; i < count; i++) {
        m_buffers.push_back(std::make_unique<sample_buffer>(capacity));
    }
}

std::size_t buffer_pool::size() const noexcept {
    return m_buffers.size();
}

std::size_t buffer_pool::capacity() const noexcept {
    return m_capacity;
}

sample_buffer& buffer_pool::operator[](std::size_t index) noexcept {
    return *m_buffers[index];
}

const sample_buffer& buffer_pool::operator[](std::size_t index) const noexcept {
    return *m_buffers[index];
}

bool buffer_pool::transition(std::size_t index, buffer_state from, buffer_state to) noexcept {
    return m_buffers[index]->state.compare_exchange_strong(from, to,
                                                           std::memory_order_acq_rel,
                                                           std::memory_order_acquire);
}

std::optional<std::size_t> buffer_pool::acquire_free() noexcept {
    for (std::size_t i = 0; i < m_buffers.size(); i++) {
        if (transition(i, buffer_state::free, buffer_state::filling)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> buffer_pool::oldest_filled(epoch_t epoch) const noexcept {
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < m_buffers.size(); i++) {
        const auto& b = *m_buffers[i];
        if (b.state.load(std::memory_order_acquire) != buffer_state::filled ||
            b.epoch.load(std::memory_order_relaxed) != epoch) {
            continue;
        }
        if (!best || b.sequence.load(std::memory_order_relaxed) <
                     m_buffers[*best]->sequence.load(std::memory_order_relaxed)) {
            best = i;
        }
    }
    return best;
}

std::size_t buffer_pool::count(buffer_state s) const noexcept {
    std::size_t n = 0;
    for (const auto& b : m_buffers) {
        if (b->state.load(std::memory_order_acquire) == s) {
            n++;
        }
    }
    return n;
}

void buffer_pool::reset_all() noexcept {
    for (auto& b : m_buffers) {
        b->length = 0;
        b->frames = 0;
        b->state.store(buffer_state::free, std::memory_order_release);
    }
}

} // namespace afqueue
