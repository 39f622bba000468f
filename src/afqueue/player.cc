#include <afqueue/player.hh>
#include <afqueue/audio_device.hh>
#include <afqueue/buffer_queue.hh>
#include <afqueue/command_channel.hh>
#include <afqueue/status_display.hh>
#include <afqueue/error.hh>
#include <failsafe/failsafe.hh>

namespace afqueue {

player::player(const player_config& config,
               const std::vector<std::string>& paths,
               std::shared_ptr<audio_backend> backend,
               const decoders_registry& registry,
               command_channel& channel,
               status_display* display,
               decoder_feed::stream_opener_t opener)
    : m_config(config),
      m_playlist(paths),
      m_state(config.initial_volume, config.volume_step),
      m_backend(std::move(backend)),
      m_registry(registry),
      m_channel(channel),
      m_display(display),
      m_opener(std::move(opener)) {
    m_config.validate();
}

player::~player() {
    shutdown();
}

int player::run() {
    int exit_code = 0;
    try {
        m_device = std::make_unique<audio_device>(m_backend, m_config.device_id);
        m_queue = std::make_unique<buffer_queue>(
            m_state, m_config.buffer_count, m_config.buffer_capacity_samples(),
            m_config.buffer_duration,
            [this](command event) { m_channel.push(std::move(event)); });
        m_queue->start();

        LOG_INFO("player", "Playing ", m_playlist.size(), " track(s) with ",
                 m_config.buffer_count, " buffers of ", m_config.buffer_duration.count(), " ms");

        load_current();

        while (!m_exit_requested && !m_state.is_terminal()) {
            const auto cmd = m_channel.pop_for(m_config.status_refresh);
            if (cmd) {
                apply(*cmd);
            } else if (m_channel.is_closed()) {
                LOG_INFO("player", "Command channel closed");
                m_exit_requested = true;
            }
            // A vanished device stops calling back; nothing else would end the track
            if (m_device->is_lost()) {
                throw device_error("Audio device disconnected during playback");
            }
            refresh_status();
        }
    } catch (const device_error& e) {
        m_state.fail();
        LOG_ERROR("player", "Audio device failure: ", e.what());
        report(std::string("audio device failure: ") + e.what());
        exit_code = 1;
    }

    shutdown();
    LOG_INFO("player", "Stopped in state ", m_state.status(), ", ", m_loaded, " of ",
             m_playlist.size(), " track(s) played, ", m_failed, " skipped on error");
    return exit_code;
}

void player::apply(const command& cmd) {
    LOG_DEBUG("player", "Command ", cmd, " in state ", m_state.status());

    switch (cmd.type) {
        case command_type::skip:
            if (m_state.begin_skip()) {
                skip_to_next();
            }
            break;

        case command_type::toggle_pause:
            if (m_state.toggle_pause()) {
                const bool ok = m_state.status() == playback_status::paused ? m_device->pause() : m_device->resume();
                if (!ok) {
                    LOG_WARN("player", "Device did not follow ", m_state.status());
                }
            }
            break;

        case command_type::volume_up:
            LOG_DEBUG("player", "Volume ", m_state.volume_up());
            break;

        case command_type::volume_down:
            LOG_DEBUG("player", "Volume ", m_state.volume_down());
            break;

        case command_type::exit:
            m_exit_requested = true;
            break;

        case command_type::track_finished:
        case command_type::track_failed:
            if (cmd.epoch != m_state.epoch()) {
                LOG_DEBUG("player", "Dropping stale ", cmd);
                break;
            }
            if (cmd.type == command_type::track_failed) {
                m_failed++;
                report("skipping " + m_playlist.current()->path + ": " + cmd.reason);
            }
            if (m_state.begin_skip()) {
                skip_to_next();
            }
            break;
    }
}

void player::skip_to_next() {
    if (m_state.status() != playback_status::skipping) {
        throw state_error("skip_to_next requires the skipping state");
    }
    m_device->stop();
    m_queue->flush();
    m_playlist.advance();
    load_current();
}

void player::load_current() {
    while (auto* t = m_playlist.current()) {
        if (try_load(*t)) {
            return;
        }
        m_failed++;
        if (m_state.status() == playback_status::stopped && !m_state.begin_skip()) {
            throw state_error("cannot leave the stopped state");
        }
        m_playlist.advance();
    }

    // Nothing left; make sure no adapter is read again
    m_device->stop();
    m_queue->detach();
    m_state.finish();
    LOG_INFO("player", "Playlist finished");
}

bool player::try_load(track& t) {
    auto feed = std::make_unique<decoder_feed>(m_registry, m_opener);
    try {
        t.format = feed->open(t.path);
    } catch (const io_error& e) {
        LOG_WARN("player", e.what());
        report(std::string("skipping: ") + e.what());
        return false;
    } catch (const decoder_error& e) {
        LOG_WARN("player", e.what());
        report(std::string("skipping: ") + e.what());
        return false;
    }

    m_device->stop();
    try {
        m_queue->attach(std::move(feed));
    } catch (const decoder_error& e) {
        LOG_WARN("player", e.what());
        report(std::string("skipping: ") + e.what());
        return false;
    }
    m_queue->prime();

    if (m_display) {
        m_display->show_track(m_playlist.position(), m_playlist.size(), t.path, *t.format);
    }

    m_device->start(*m_queue, m_queue->stream_spec());
    if (!m_state.track_loaded()) {
        throw state_error("track loaded outside of stopped or skipping state");
    }
    if (!m_device->resume()) {
        LOG_WARN("player", "Device did not resume");
    }
    m_loaded++;
    LOG_INFO("player", "Track ", m_playlist.position() + 1, "/", m_playlist.size(), ": ", t.path);
    return true;
}

void player::refresh_status() {
    if (!m_display || !m_queue || m_state.is_terminal()) {
        return;
    }
    const auto* t = m_playlist.current();
    if (!t || !t->format) {
        return;
    }

    status_snapshot s;
    s.status = m_state.status();
    s.elapsed = std::chrono::milliseconds(m_queue->frames_played() * 1000 / t->format->sample_rate);
    s.duration = t->format->duration;
    s.gain = m_state.gain();
    s.underruns = m_queue->underruns();
    float levels[buffer_queue::METER_CHANNELS];
    const auto n = m_queue->peak_levels(levels, buffer_queue::METER_CHANNELS);
    s.levels.assign(levels, levels + n);
    m_display->update(s);
}

void player::report(const std::string& msg) {
    if (m_display) {
        m_display->show_message(msg);
    }
}

void player::shutdown() {
    if (m_device) {
        m_device->stop();
    }
    if (m_queue) {
        m_queue->stop();
        m_queue->detach();
    }
    m_device.reset();
    m_queue.reset();
    if (m_display) {
        m_display->finish();
    }
}

playback_status player::status() const {
    return m_state.status();
}

const playback_state& player::state() const {
    return m_state;
}

const playlist& player::tracks() const {
    return m_playlist;
}

std::size_t player::loaded_tracks() const {
    return m_loaded;
}

std::size_t player::failed_tracks() const {
    return m_failed;
}

} // namespace afqueue
