#include <afqueue/playback_state.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <ostream>

namespace afqueue {

std::ostream& operator<<(std::ostream& os, playback_status s) {
    switch (s) {
        case playback_status::stopped: return os << "Stopped";
        case playback_status::playing: return os << "Playing";
        case playback_status::paused: return os << "Paused";
        case playback_status::skipping: return os << "Skipping";
        case playback_status::finished: return os << "Finished";
        case playback_status::error: return os << "Error";
    }
    return os << "Unknown";
}

namespace {
    float clamp_gain(float g) {
        if (std::isnan(g)) {
            return 0.0f;
        }
        return std::clamp(g, 0.0f, 1.0f);
    }
}

playback_state::playback_state(float initial_gain, float volume_step)
    : m_gain(clamp_gain(initial_gain)),
      m_step(std::isfinite(volume_step) ? std::abs(volume_step) : 0.0f) {
}

playback_status playback_state::status() const noexcept {
    return m_status.load(std::memory_order_acquire);
}

bool playback_state::is_playing() const noexcept {
    return status() == playback_status::playing;
}

bool playback_state::is_terminal() const noexcept {
    const auto s = status();
    return s == playback_status::finished || s == playback_status::error;
}

bool playback_state::move(std::initializer_list<playback_status> from, playback_status to) {
    const auto current = status();
    if (std::find(from.begin(), from.end(), current) == from.end()) {
        LOG_DEBUG("player", "Rejected transition ", current, " -> ", to);
        return false;
    }
    m_status.store(to, std::memory_order_release);
    return true;
}

bool playback_state::track_loaded() {
    return move({playback_status::stopped, playback_status::skipping}, playback_status::playing);
}

bool playback_state::pause() {
    return move({playback_status::playing}, playback_status::paused);
}

bool playback_state::resume() {
    return move({playback_status::paused}, playback_status::playing);
}

bool playback_state::toggle_pause() {
    return status() == playback_status::paused ? resume() : pause();
}

bool playback_state::begin_skip() {
    if (!move({playback_status::stopped, playback_status::playing, playback_status::paused},
              playback_status::skipping)) {
        return false;
    }
    m_epoch.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

bool playback_state::finish() {
    return move({playback_status::stopped, playback_status::skipping}, playback_status::finished);
}

bool playback_state::fail() {
    if (status() == playback_status::error) {
        return false;
    }
    m_status.store(playback_status::error, std::memory_order_release);
    return true;
}

float playback_state::gain() const noexcept {
    return m_gain.load(std::memory_order_relaxed);
}

float playback_state::set_gain(float g) noexcept {
    const auto v = clamp_gain(g);
    m_gain.store(v, std::memory_order_relaxed);
    return v;
}

float playback_state::volume_up() noexcept {
    return set_gain(gain() + m_step);
}

float playback_state::volume_down() noexcept {
    return set_gain(gain() - m_step);
}

epoch_t playback_state::epoch() const noexcept {
    return m_epoch.load(std::memory_order_acquire);
}

} // namespace afqueue
