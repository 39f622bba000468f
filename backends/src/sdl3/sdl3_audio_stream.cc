#include "sdl3_audio_stream.hh"
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <string>

namespace afqueue {

// SDL_Quit() already destroyed every stream
static void safe_destroy_audio_stream(SDL_AudioStream* stream) {
    if (stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_DestroyAudioStream(stream);
    }
}

sdl3_audio_stream::sdl3_audio_stream(SDL_AudioDeviceID device_id, const audio_spec& spec,
                                     SDL_AudioFormat sdl_format,
                                     audio_callback_t callback, void* userdata)
    : m_device_id(device_id)
    , m_callback(callback)
    , m_userdata(userdata)
    , m_bound(false) {

    if (!m_callback) {
        THROW_RUNTIME("sdl3_audio_stream requires a render callback");
    }

    SDL_AudioSpec sdl_spec;
    sdl_spec.format = sdl_format;
    sdl_spec.channels = spec.channels;
    sdl_spec.freq = static_cast<int>(spec.freq);
    m_frame_bytes = static_cast<size_t>(SDL_AUDIO_FRAMESIZE(sdl_spec));
    if (m_frame_bytes == 0) {
        THROW_RUNTIME("sdl3_audio_stream requires at least one channel");
    }

    SDL_AudioSpec device_spec;
    int device_frames = 0;
    if (!SDL_GetAudioDeviceFormat(m_device_id, &device_spec, &device_frames)) {
        THROW_RUNTIME(std::string("Failed to get device format: ") + SDL_GetError());
    }

    // A tenth of a second or four device periods, whichever is larger.
    // Requests beyond it are rendered in pieces, so the audio thread never allocates.
    const auto tenth = static_cast<size_t>(spec.freq) / 10;
    const auto periods = device_frames > 0 ? static_cast<size_t>(device_frames) * 4 : 0;
    m_scratch.resize(std::max<size_t>({tenth, periods, 1}) * m_frame_bytes);

    // SDL converts from the track format to the device format
    m_stream = std::shared_ptr<SDL_AudioStream>(
        SDL_CreateAudioStream(&sdl_spec, &device_spec),
        safe_destroy_audio_stream
    );

    if (!m_stream) {
        THROW_RUNTIME(std::string("Failed to create audio stream: ") + SDL_GetError());
    }

    if (!SDL_SetAudioStreamGetCallback(m_stream.get(), sdl_callback, this)) {
        THROW_RUNTIME(std::string("Failed to set stream callback: ") + SDL_GetError());
    }

    if (!SDL_BindAudioStream(m_device_id, m_stream.get())) {
        THROW_RUNTIME(std::string("Failed to bind stream to device: ") + SDL_GetError());
    }
    m_bound = true;
}

sdl3_audio_stream::~sdl3_audio_stream() {
    // Unbinding waits for a callback in flight to return
    unbind_from_device();
}

void sdl3_audio_stream::sdl_callback(void* userdata,
    SDL_AudioStream* stream,
    int additional_amount, [[maybe_unused]] int total_amount) {
    auto* self = static_cast<sdl3_audio_stream*>(userdata);
    if (!self || additional_amount <= 0) {
        return;
    }

    uint8_t* const scratch = self->m_scratch.data();
    for_each_piece(static_cast<size_t>(additional_amount), self->m_scratch.size(), self->m_frame_bytes,
                   [self, stream, scratch](size_t chunk) {
                       self->m_callback(self->m_userdata, scratch, static_cast<int>(chunk));
                       return SDL_PutAudioStreamData(stream, scratch, static_cast<int>(chunk));
                   });
}

void sdl3_audio_stream::clear() {
    SDL_ClearAudioStream(m_stream.get());
}

bool sdl3_audio_stream::pause() {
    return SDL_PauseAudioStreamDevice(m_stream.get());
}

bool sdl3_audio_stream::resume() {
    return SDL_ResumeAudioStreamDevice(m_stream.get());
}

bool sdl3_audio_stream::is_paused() const {
    return SDL_AudioStreamDevicePaused(m_stream.get());
}

bool sdl3_audio_stream::bind_to_device() {
    if (!m_bound && m_stream) {
        if (SDL_BindAudioStream(m_device_id, m_stream.get())) {
            m_bound = true;
            return true;
        }
    }
    return false;
}

void sdl3_audio_stream::unbind_from_device() {
    if (m_bound && m_stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_UnbindAudioStream(m_stream.get());
    }
    m_bound = false;
}

} // namespace afqueue
