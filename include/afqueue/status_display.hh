#ifndef AFQUEUE_STATUS_DISPLAY_HH
#define AFQUEUE_STATUS_DISPLAY_HH

#include <afqueue/decoder_feed.hh>
#include <afqueue/playback_state.hh>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace afqueue {

    struct status_snapshot {
        playback_status status = playback_status::stopped;
        std::chrono::milliseconds elapsed{0};
        std::chrono::microseconds duration{0};
        float gain = 1.0f;
        uint64_t underruns = 0;
        std::vector<float> levels;
    };

    /// "m:ss", or "h:mm:ss" from one hour on
    std::string format_time(std::chrono::milliseconds t);

    /// One line: state, elapsed / duration, volume percent, underruns
    std::string format_status_line(const status_snapshot& s);

    /// Meter bar of @p width cells for a level in [0, 1]
    std::string format_meter(float level, std::size_t width);

    /**
     * @class status_display
     * @brief Terminal UI of the player
     *
     * Each track clears the screen and prints a header (position in the
     * playlist, path, format). Below it a status line and one meter bar per
     * channel are redrawn in place. Lines end in "\r\n" because output
     * post-processing is off in raw mode. With @p ansi false no control
     * sequences are written and only the header and messages appear.
     *
     * A width source, when set, is asked before every update whether the
     * terminal changed size; a new width clears the screen and redraws the
     * header so no wrapped status lines are left behind.
     */
    class status_display {
        public:
            /// New column count, or nullopt when the size did not change
            using width_source_t = std::function<std::optional<std::size_t>()>;

            status_display(std::ostream& out, bool ansi);

            void show_track(std::size_t index, std::size_t total,
                            const std::string& path, const format_info& fmt);

            void show_message(const std::string& msg);

            void update(const status_snapshot& s);

            /// Leave the cursor below the status block
            void finish();

            void set_width(std::size_t columns);

            /// Apply a new terminal width, redrawing the current header
            void resize(std::size_t columns);

            void set_width_source(width_source_t source);

            [[nodiscard]] std::size_t width() const;

        private:
            struct track_header {
                std::size_t index = 0;
                std::size_t total = 0;
                std::string path;
                format_info fmt;
            };

            void write_header(const track_header& h);

            std::ostream& m_out;
            bool m_ansi;
            std::size_t m_width = 80;
            std::size_t m_drawn_lines = 0;
            std::optional<track_header> m_header;
            width_source_t m_width_source;
    };

} // namespace afqueue

#endif
