#ifndef AFQUEUE_PLAYER_HH
#define AFQUEUE_PLAYER_HH

#include <afqueue/config.hh>
#include <afqueue/decoder_feed.hh>
#include <afqueue/playback_state.hh>
#include <afqueue/playlist.hh>
#include <memory>
#include <string>
#include <vector>

namespace afqueue {

    class audio_backend;
    class audio_device;
    class buffer_queue;
    class command_channel;
    class decoders_registry;
    class status_display;
    struct command;

    /**
     * @class player
     * @brief Moderator of a playback session
     *
     * Owns the playlist and the state machine; for the duration of run() it
     * also owns the output device and the buffer queue. Commands from the
     * channel are applied one at a time in arrival order, so transport
     * changes never race each other.
     *
     * Tracks that cannot be opened are reported and skipped. Engine events
     * (track_finished, track_failed) are applied only when their epoch is
     * the current one.
     *
     * @code
     * command_channel channel;
     * player p(config, paths, create_sdl3_backend(), registry, channel);
     * input_loop keys(STDIN_FILENO, channel);
     * keys.start();
     * return p.run();
     * @endcode
     */
    class player {
        public:
            player(const player_config& config,
                   const std::vector<std::string>& paths,
                   std::shared_ptr<audio_backend> backend,
                   const decoders_registry& registry,
                   command_channel& channel,
                   status_display* display = nullptr,
                   decoder_feed::stream_opener_t opener = decoder_feed::stream_opener_t());
            ~player();

            player(const player&) = delete;
            player& operator=(const player&) = delete;

            /**
             * @brief Play until the playlist is finished or exit is requested
             *
             * Device failures move the state machine to Error and end the
             * run.
             *
             * @return 0 when finished or on user exit, 1 on a device failure
             */
            int run();

            [[nodiscard]] playback_status status() const;
            [[nodiscard]] const playback_state& state() const;
            [[nodiscard]] const playlist& tracks() const;

            /// Tracks that were opened and started
            [[nodiscard]] std::size_t loaded_tracks() const;
            /// Tracks skipped because they could not be opened or decoded
            [[nodiscard]] std::size_t failed_tracks() const;

        private:
            void apply(const command& cmd);
            void skip_to_next();
            void load_current();
            bool try_load(track& t);
            void refresh_status();
            void report(const std::string& msg);
            void shutdown();

            player_config m_config;
            playlist m_playlist;
            playback_state m_state;
            std::shared_ptr<audio_backend> m_backend;
            const decoders_registry& m_registry;
            command_channel& m_channel;
            status_display* m_display;
            decoder_feed::stream_opener_t m_opener;

            std::unique_ptr<audio_device> m_device;
            std::unique_ptr<buffer_queue> m_queue;
            bool m_exit_requested = false;
            std::size_t m_loaded = 0;
            std::size_t m_failed = 0;
    };

} // namespace afqueue

#endif
