#ifndef AFQUEUE_SDL3_AUDIO_STREAM_HH
#define AFQUEUE_SDL3_AUDIO_STREAM_HH

#include <afqueue/sdk/audio_backend.hh>
#include <afqueue/sdk/audio_stream_interface.hh>
#include "sdl3.hh"
#include <memory>
#include <vector>

namespace afqueue {

class sdl3_audio_stream : public audio_stream_interface {
public:
    sdl3_audio_stream(SDL_AudioDeviceID device_id, const audio_spec& spec, SDL_AudioFormat sdl_format,
                      audio_callback_t callback, void* userdata);
    ~sdl3_audio_stream() override;

    void clear() override;
    bool pause() override;
    bool resume() override;
    bool is_paused() const override;
    bool bind_to_device() override;
    void unbind_from_device() override;

private:
    static void sdl_callback(void* userdata, SDL_AudioStream* stream, int additional_amount, int total_amount);

    SDL_AudioDeviceID m_device_id;
    std::shared_ptr<SDL_AudioStream> m_stream;
    audio_callback_t m_callback;
    void* m_userdata;
    bool m_bound;
    size_t m_frame_bytes = 0;
    // Sized once at construction; larger requests are split
    std::vector<uint8_t> m_scratch;
};

} // namespace afqueue

#endif // AFQUEUE_SDL3_AUDIO_STREAM_HH
