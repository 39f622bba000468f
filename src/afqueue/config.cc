#include <afqueue/config.hh>
#include <afqueue/error.hh>
#include <cmath>
#include <string>

namespace afqueue {

void player_config::validate() const {
    if (buffer_count < MIN_BUFFER_COUNT || buffer_count > MAX_BUFFER_COUNT) {
        throw config_error("buffer count must be between " + std::to_string(MIN_BUFFER_COUNT)
                           + " and " + std::to_string(MAX_BUFFER_COUNT)
                           + ", got " + std::to_string(buffer_count));
    }
    const auto ms = buffer_duration.count();
    if (ms < MIN_BUFFER_MS || ms > MAX_BUFFER_MS) {
        throw config_error("buffer duration must be between " + std::to_string(MIN_BUFFER_MS)
                           + " and " + std::to_string(MAX_BUFFER_MS)
                           + " ms, got " + std::to_string(ms));
    }
    if (!std::isfinite(volume_step) || volume_step <= 0.0f || volume_step > 1.0f) {
        throw config_error("volume step must be in (0, 1]");
    }
    if (!std::isfinite(initial_volume) || initial_volume < 0.0f || initial_volume > 1.0f) {
        throw config_error("initial volume must be in [0, 1]");
    }
    if (status_refresh.count() <= 0) {
        throw config_error("status refresh period must be positive");
    }
    if (max_sample_rate == 0 || max_channels == 0) {
        throw config_error("format limits must be positive");
    }
}

std::size_t player_config::buffer_capacity_samples() const {
    const auto frames = static_cast<std::size_t>(max_sample_rate) *
                        static_cast<std::size_t>(buffer_duration.count()) / 1000;
    return frames * max_channels;
}

} // namespace afqueue
