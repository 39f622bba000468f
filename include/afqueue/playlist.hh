#ifndef AFQUEUE_PLAYLIST_HH
#define AFQUEUE_PLAYLIST_HH

#include <afqueue/decoder_feed.hh>
#include <optional>
#include <string>
#include <vector>

namespace afqueue {

    struct track {
        std::string path;
        /// Known once the track has been opened
        std::optional<format_info> format;
    };

    /**
     * @class playlist
     * @brief Ordered tracks and a cursor over them
     *
     * The cursor stays within [0, size()]; size() is the finished position.
     * There is no wraparound.
     */
    class playlist {
        public:
            explicit playlist(const std::vector<std::string>& paths);

            /**
             * @brief Current track, nullptr once finished
             */
            [[nodiscard]] const track* current() const;
            [[nodiscard]] track* current();

            /**
             * @brief Move to the next track
             * @return false if the playlist was already finished
             */
            bool advance();

            [[nodiscard]] bool has_next() const;
            [[nodiscard]] bool is_finished() const;
            [[nodiscard]] std::size_t position() const;
            [[nodiscard]] std::size_t size() const;

        private:
            std::vector<track> m_tracks;
            std::size_t m_cursor = 0;
    };

} // namespace afqueue

#endif
