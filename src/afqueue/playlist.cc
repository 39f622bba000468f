#include <afqueue/playlist.hh>
#include <failsafe/failsafe.hh>

namespace afqueue {

playlist::playlist(const std::vector<std::string>& paths) {
    m_tracks.reserve(paths.size());
    for (const auto& p : paths) {
        m_tracks.push_back(track{p, std::nullopt});
    }
}

const track* playlist::current() const {
    return is_finished() ? nullptr : &m_tracks[m_cursor];
}

track* playlist::current() {
    return is_finished() ? nullptr : &m_tracks[m_cursor];
}

bool playlist::advance() {
    if (is_finished()) {
        return false;
    }
    m_cursor++;
    if (is_finished()) {
        LOG_DEBUG("playlist", "End of playlist reached");
    }
    return true;
}

bool playlist::has_next() const {
    return m_cursor + 1 < m_tracks.size();
}

bool playlist::is_finished() const {
    return m_cursor >= m_tracks.size();
}

std::size_t playlist::position() const {
    return m_cursor;
}

std::size_t playlist::size() const {
    return m_tracks.size();
}

} // namespace afqueue
