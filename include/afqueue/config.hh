#ifndef AFQUEUE_CONFIG_HH
#define AFQUEUE_CONFIG_HH

#include <chrono>
#include <cstddef>
#include <string>

#ifndef AFQUEUE_DEFAULT_BUFFER_COUNT
#define AFQUEUE_DEFAULT_BUFFER_COUNT 3
#endif

#ifndef AFQUEUE_DEFAULT_BUFFER_MS
#define AFQUEUE_DEFAULT_BUFFER_MS 500
#endif

#ifndef AFQUEUE_DEFAULT_VOLUME_LEVELS
#define AFQUEUE_DEFAULT_VOLUME_LEVELS 16
#endif

#ifndef AFQUEUE_DEFAULT_STATUS_REFRESH_MS
#define AFQUEUE_DEFAULT_STATUS_REFRESH_MS 250
#endif

namespace afqueue {

    constexpr std::size_t MIN_BUFFER_COUNT = 2;
    constexpr std::size_t MAX_BUFFER_COUNT = 16;
    constexpr long MIN_BUFFER_MS = 20;
    constexpr long MAX_BUFFER_MS = 5000;

    /**
     * @brief Tunables of a player run
     *
     * Defaults come from the AFQUEUE_DEFAULT_* compile definitions and are
     * overridden from the command line.
     */
    struct player_config {
        /// Number of SampleBuffers in the pool
        std::size_t buffer_count = AFQUEUE_DEFAULT_BUFFER_COUNT;
        /// Playback time held by one buffer
        std::chrono::milliseconds buffer_duration{AFQUEUE_DEFAULT_BUFFER_MS};
        /// Gain change per volume key press
        float volume_step = 1.0f / AFQUEUE_DEFAULT_VOLUME_LEVELS;
        float initial_volume = 1.0f;
        /// Backend device id, empty for the default device
        std::string device_id;
        bool use_null_backend = false;
        std::chrono::milliseconds status_refresh{AFQUEUE_DEFAULT_STATUS_REFRESH_MS};
        /// Upper bound for the sample rate used when sizing the pool
        unsigned max_sample_rate = 96000;
        /// Upper bound for the channel count used when sizing the pool
        unsigned max_channels = 8;

        /**
         * @brief Check ranges
         * @throws config_error naming the offending field
         */
        void validate() const;

        /// Samples each pool buffer must hold for the largest supported format
        [[nodiscard]] std::size_t buffer_capacity_samples() const;
    };

} // namespace afqueue

#endif
