#ifndef AFQUEUE_COMMAND_HH
#define AFQUEUE_COMMAND_HH

#include <afqueue/sdk/types.hh>
#include <iosfwd>
#include <string>
#include <utility>

namespace afqueue {

    enum class command_type : uint8_t {
        skip,
        toggle_pause,
        volume_up,
        volume_down,
        exit,
        /// Engine event: the current track played to its end
        track_finished,
        /// Engine event: decoding the current track failed mid-stream
        track_failed
    };

    /**
     * @brief Message carried by the command channel
     *
     * User commands carry only a type. Engine events also carry the epoch
     * they were raised in so that the moderator can drop stale ones.
     */
    struct command {
        command_type type = command_type::skip;
        epoch_t epoch = 0;
        std::string reason;

        static command make(command_type t) {
            return command{t, 0, {}};
        }

        static command track_finished(epoch_t e) {
            return command{command_type::track_finished, e, {}};
        }

        static command track_failed(epoch_t e, std::string why) {
            return command{command_type::track_failed, e, std::move(why)};
        }

        [[nodiscard]] bool is_engine_event() const {
            return type == command_type::track_finished || type == command_type::track_failed;
        }
    };

    std::ostream& operator<<(std::ostream& os, command_type t);
    std::ostream& operator<<(std::ostream& os, const command& c);

} // namespace afqueue

#endif
