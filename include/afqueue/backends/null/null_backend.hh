#ifndef AFQUEUE_BACKENDS_NULL_BACKEND_HH
#define AFQUEUE_BACKENDS_NULL_BACKEND_HH

#include <memory>

namespace afqueue {

class audio_backend;

/**
 * @brief Create a backend that plays into nothing
 *
 * Every stream created on it gets its own clock thread that pulls the
 * render callback in 10 ms periods at real-time pace and discards the data.
 * Used for headless runs (`--null-audio`) where no sound hardware exists.
 */
std::unique_ptr<audio_backend> create_null_backend();

} // namespace afqueue

#endif // AFQUEUE_BACKENDS_NULL_BACKEND_HH
