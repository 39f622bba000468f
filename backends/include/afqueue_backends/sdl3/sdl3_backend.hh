/**
 * @file sdl3_backend.hh
 * @brief SDL3 audio backend factory
 * @ingroup backends
 */

#ifndef AFQUEUE_BACKENDS_SDL3_BACKEND_HH
#define AFQUEUE_BACKENDS_SDL3_BACKEND_HH

#include <memory>

namespace afqueue {

class audio_backend;

/**
 * @brief Create an SDL3 audio backend instance
 * @return New, uninitialized backend
 *
 * Streams created on this backend are pulled by SDL's audio thread through
 * SDL_SetAudioStreamGetCallback and converted by SDL from the stream format
 * to the device format, so a track can be played at its native rate and
 * channel count.
 *
 * SDL3 respects `SDL_AUDIO_DRIVER` and `SDL_AUDIO_DEVICE_NAME`.
 *
 * @code
 * auto backend = afqueue::create_sdl3_backend();
 * backend->init();
 * @endcode
 */
std::unique_ptr<audio_backend> create_sdl3_backend();

} // namespace afqueue

#endif // AFQUEUE_BACKENDS_SDL3_BACKEND_HH
