#ifndef AFQUEUE_SDL3_BACKEND_IMPL_HH
#define AFQUEUE_SDL3_BACKEND_IMPL_HH

#include <afqueue/sdk/audio_backend.hh>
#include "sdl3.hh"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace afqueue {

/**
 * SDL3 playback backend.
 *
 * Handles returned by open_device() are small integers mapped to SDL device
 * ids, so a closed handle is never confused with a reopened device.
 * SDL_EVENT_AUDIO_DEVICE_REMOVED is observed through an event watch and
 * marks the matching handle lost.
 */
class sdl3_backend : public audio_backend {
public:
    sdl3_backend() = default;
    ~sdl3_backend() override;

    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;

    std::vector<device_info> enumerate_devices() override;

    uint32_t open_device(const std::string& device_id,
                         const audio_spec& spec,
                         audio_spec& obtained_spec) override;
    void close_device(uint32_t device_handle) override;

    bool pause_device(uint32_t device_handle) override;
    bool resume_device(uint32_t device_handle) override;
    bool is_device_paused(uint32_t device_handle) override;
    bool is_device_lost(uint32_t device_handle) override;

    std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) override;

private:
    struct open_device_entry {
        SDL_AudioDeviceID sdl_id = 0;
        bool lost = false;
    };

    /// SDL id behind @p device_handle, 0 when the handle is unknown
    SDL_AudioDeviceID lookup(uint32_t device_handle) const;
    void require_initialized(const char* operation) const;

    // Runs on whichever thread SDL posts the event from
    static bool SDLCALL watch_events(void* userdata, SDL_Event* event);
    void mark_lost(SDL_AudioDeviceID sdl_id);

    bool m_initialized = false;
    std::map<uint32_t, open_device_entry> m_open_devices;
    mutable std::mutex m_devices_mutex;
    uint32_t m_next_handle = 1;
};

} // namespace afqueue

#endif // AFQUEUE_SDL3_BACKEND_IMPL_HH
