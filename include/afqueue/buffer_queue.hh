#ifndef AFQUEUE_BUFFER_QUEUE_HH
#define AFQUEUE_BUFFER_QUEUE_HH

#include <afqueue/audio_device.hh>
#include <afqueue/buffer_pool.hh>
#include <afqueue/command.hh>
#include <afqueue/sdk/types.hh>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace afqueue {

    class decoder_feed;
    class playback_state;

    /**
     * @class buffer_queue
     * @brief Streams one track at a time through a fixed buffer pool
     *
     * Three parties share the pool:
     *
     * - the **render path** (render(), called on the device thread) plays
     *   filled buffers in fill order, applying the current gain as it copies;
     * - the **refill worker** (a background thread running service()) decodes
     *   into free buffers and publishes them as filled;
     * - the **moderator** calls attach(), prime() and flush() on transport
     *   changes.
     *
     * Every buffer is tagged with the epoch it was decoded for. The epoch is
     * owned by playback_state and bumped on every skip; buffers of an older
     * epoch are dropped unplayed.
     *
     * The render path takes no lock, never allocates and never logs. It
     * reports back only through atomics: underrun and stale-drop counters,
     * the played frame count and a once-per-epoch "track complete" flag which
     * the worker forwards to the event sink as a track_finished command.
     * Decode failures reach the sink as track_failed.
     */
    class buffer_queue : public render_source {
        public:
            using event_sink_t = std::function<void(command)>;

            /**
             * @param state Source of status, gain and epoch
             * @param buffer_count Pool size, at least 2
             * @param buffer_capacity Samples per pool buffer
             * @param buffer_duration Playback time one buffer holds
             * @param sink Receives track_finished and track_failed events
             * @throws config_error on an invalid pool geometry
             */
            buffer_queue(const playback_state& state,
                         std::size_t buffer_count,
                         std::size_t buffer_capacity,
                         std::chrono::milliseconds buffer_duration,
                         event_sink_t sink);
            ~buffer_queue() override;

            buffer_queue(const buffer_queue&) = delete;
            buffer_queue& operator=(const buffer_queue&) = delete;

            /**
             * @brief Launch the refill worker
             */
            void start();

            /**
             * @brief Stop and join the refill worker
             */
            void stop();

            /**
             * @brief Switch to an opened track for the current epoch
             *
             * No render call may be in flight (the device stream is stopped).
             * Buffers left over from the previous track are released.
             *
             * @return The previously attached feed, if any
             * @throws decoder_error if the track's frames do not fit a pool buffer
             */
            std::unique_ptr<decoder_feed> attach(std::unique_ptr<decoder_feed> feed);

            /**
             * @brief Detach and return the current feed
             */
            std::unique_ptr<decoder_feed> detach();

            /**
             * @brief Fill every free buffer synchronously
             * @return Number of buffers filled; fewer than the pool size for short tracks
             */
            std::size_t prime();

            /**
             * @brief Discard everything queued for older epochs
             *
             * Call after playback_state::begin_skip() bumped the epoch. Filled
             * buffers return to free at once; a fill in progress is abandoned
             * when the worker finishes its current read; the buffer being
             * played is dropped by the render path at its next call.
             */
            void flush();

            void render(float* out, std::size_t frames) noexcept override;

            /**
             * @brief Retire a played buffer and pick the next one
             *
             * Called by the render path. @p consumed may be null.
             *
             * @return The next filled buffer of the current epoch (now playing),
             *         silence_buffer() on underrun, or nullptr once the track is
             *         complete
             */
            sample_buffer* on_buffer_consumed(sample_buffer* consumed) noexcept;

            /**
             * @brief Pick what follows once a scan found no filled buffer
             *
             * The worker may publish the final buffer and the end-of-track
             * mark between that scan and this call, so the pool is scanned
             * again before the track is declared complete.
             *
             * @return A buffer now playing, silence_buffer() on underrun, or
             *         nullptr once the track is complete
             */
            sample_buffer* after_empty_scan(epoch_t epoch) noexcept;

            /**
             * @brief One worker iteration: forward events, log underruns, refill
             *
             * The worker calls this every time it wakes up. Safe to call from
             * any thread; used directly by tests that run without a worker.
             */
            void service();

            [[nodiscard]] const sample_buffer* silence_buffer() const noexcept;

            /// Format for a device stream playing the attached track
            [[nodiscard]] audio_spec stream_spec() const;

            [[nodiscard]] std::size_t frames_per_buffer() const;

            [[nodiscard]] uint64_t underruns() const noexcept;
            [[nodiscard]] uint64_t stale_drops() const noexcept;
            /// Frames rendered from the attached track so far
            [[nodiscard]] uint64_t frames_played() const noexcept;
            [[nodiscard]] bool end_of_track() const noexcept;

            /**
             * @brief Per-channel peak of the most recent render call, after gain
             * @return Number of levels written (at most @p max and METER_CHANNELS)
             */
            std::size_t peak_levels(float* out, std::size_t max) const noexcept;

            static constexpr std::size_t METER_CHANNELS = 8;
            [[nodiscard]] bool track_complete() const noexcept;

            [[nodiscard]] const buffer_pool& pool() const noexcept;

        private:
            std::size_t refill();
            bool fill_one_locked();
            sample_buffer* take_oldest_filled(epoch_t epoch) noexcept;
            void release(sample_buffer* b) noexcept;
            void publish_peaks(const std::array<float, METER_CHANNELS>& peaks) noexcept;
            void wake_worker() noexcept;
            void worker_loop();

            static constexpr epoch_t NO_MARK = 0;
            static epoch_t mark(epoch_t e) noexcept { return e + 1; }

            const playback_state& m_state;
            buffer_pool m_pool;
            std::chrono::milliseconds m_buffer_duration;
            event_sink_t m_sink;

            // Guards the feed and every fill
            mutable std::mutex m_feed_mutex;
            std::unique_ptr<decoder_feed> m_feed;
            epoch_t m_feed_epoch = 0;
            std::size_t m_frames_per_buffer = 0;
            sample_rate_t m_rate = 0;
            uint64_t m_next_sequence = 0;
            std::atomic<channels_t> m_channels{0};

            // Per-epoch markers, stored as epoch + 1 so that 0 means unset
            std::atomic<epoch_t> m_eot_mark{NO_MARK};
            std::atomic<epoch_t> m_failed_mark{NO_MARK};
            std::atomic<epoch_t> m_complete_mark{NO_MARK};
            std::atomic<bool> m_complete_pending{false};

            // Render thread only
            sample_buffer* m_playing = nullptr;
            std::size_t m_cursor = 0;
            sample_buffer m_silence;

            std::atomic<uint64_t> m_underruns{0};
            std::atomic<uint64_t> m_stale_drops{0};
            std::atomic<uint64_t> m_frames_played{0};
            std::array<std::atomic<float>, METER_CHANNELS> m_peaks{};
            uint64_t m_reported_underruns = 0;

            std::mutex m_work_mutex;
            std::condition_variable m_work_cv;
            std::atomic<bool> m_work_pending{false};
            std::atomic<bool> m_running{false};
            std::thread m_worker;
    };

} // namespace afqueue

#endif
