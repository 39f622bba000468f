#ifndef AFQUEUE_PLAYBACK_STATE_HH
#define AFQUEUE_PLAYBACK_STATE_HH

#include <afqueue/sdk/types.hh>
#include <atomic>
#include <initializer_list>
#include <iosfwd>

namespace afqueue {

    enum class playback_status : uint8_t {
        stopped,
        playing,
        paused,
        skipping,
        finished,
        error
    };

    std::ostream& operator<<(std::ostream& os, playback_status s);

    /**
     * @class playback_state
     * @brief Transport state, gain and epoch of a playback session
     *
     * Only the moderator thread requests transitions. The render path reads
     * status, gain and epoch through lock-free atomic loads.
     *
     * Transitions:
     *
     * | from                       | request          | to       |
     * |----------------------------|------------------|----------|
     * | stopped, skipping          | track_loaded()   | playing  |
     * | playing                    | pause()          | paused   |
     * | paused                     | resume()         | playing  |
     * | stopped, playing, paused   | begin_skip()     | skipping |
     * | stopped, skipping          | finish()         | finished |
     * | any but error              | fail()           | error    |
     *
     * A request not in the table returns false and changes nothing.
     * Every transition into skipping increments the epoch.
     */
    class playback_state {
        public:
            /**
             * @param initial_gain Clamped to [0, 1]
             * @param volume_step Gain change for volume_up() and volume_down()
             */
            explicit playback_state(float initial_gain = 1.0f, float volume_step = 1.0f / 16.0f);

            playback_state(const playback_state&) = delete;
            playback_state& operator=(const playback_state&) = delete;

            [[nodiscard]] playback_status status() const noexcept;
            [[nodiscard]] bool is_playing() const noexcept;
            [[nodiscard]] bool is_terminal() const noexcept;

            bool track_loaded();
            bool pause();
            bool resume();
            /// pause() when playing, resume() when paused
            bool toggle_pause();
            bool begin_skip();
            bool finish();
            bool fail();

            [[nodiscard]] float gain() const noexcept;

            /**
             * @brief Set the gain, clamped to [0, 1]; NaN becomes 0
             * @return The stored gain
             */
            float set_gain(float g) noexcept;
            float volume_up() noexcept;
            float volume_down() noexcept;

            [[nodiscard]] epoch_t epoch() const noexcept;

        private:
            bool move(std::initializer_list<playback_status> from, playback_status to);

            std::atomic<playback_status> m_status{playback_status::stopped};
            std::atomic<float> m_gain;
            std::atomic<epoch_t> m_epoch{0};
            float m_step;
    };

} // namespace afqueue

#endif
