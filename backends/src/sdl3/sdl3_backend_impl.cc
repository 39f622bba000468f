#include "sdl3_backend_impl.hh"
#include "sdl3_audio_stream.hh"
#include <failsafe/failsafe.hh>
#include <cstdlib>

namespace afqueue {
    namespace {
        std::string last_sdl_error() {
            const char* error = SDL_GetError();
            return (error && *error) ? error : "unknown SDL error";
        }

        // afqueue renders float samples; anything else is converted by SDL
        SDL_AudioFormat sdl_format_of(audio_format fmt) {
            switch (fmt) {
                case audio_format::s16le: return SDL_AUDIO_S16LE;
                case audio_format::s32le: return SDL_AUDIO_S32LE;
                case audio_format::f32be: return SDL_AUDIO_F32BE;
                default: return SDL_AUDIO_F32LE;
            }
        }

        audio_format format_of(SDL_AudioFormat fmt) {
            switch (fmt) {
                case SDL_AUDIO_S16LE: return audio_format::s16le;
                case SDL_AUDIO_S32LE: return audio_format::s32le;
                case SDL_AUDIO_F32LE: return audio_format::f32le;
                case SDL_AUDIO_F32BE: return audio_format::f32be;
                default: return audio_format::unknown;
            }
        }

        audio_spec spec_of(const SDL_AudioSpec& s) {
            audio_spec out;
            out.format = format_of(s.format);
            out.channels = static_cast<channels_t>(s.channels);
            out.freq = static_cast<sample_rate_t>(s.freq);
            return out;
        }

        std::string device_name(SDL_AudioDeviceID id) {
            const char* name = SDL_GetAudioDeviceName(id);
            return name ? name : std::string();
        }

        // Playback devices as an owned list; SDL hands out a malloc'ed array
        std::vector<SDL_AudioDeviceID> playback_devices() {
            std::vector<SDL_AudioDeviceID> ids;
            int count = 0;
            SDL_AudioDeviceID* raw = SDL_GetAudioPlaybackDevices(&count);
            if (raw) {
                ids.assign(raw, raw + count);
                SDL_free(raw);
            }
            return ids;
        }

#if defined(AFQUEUE_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(AFQUEUE_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#endif
        // "", "default", a numeric SDL id from enumerate_devices() or a device name
        SDL_AudioDeviceID resolve_device(const std::string& device_id) {
            if (device_id.empty() || device_id == "default") {
                return SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK;
            }

            char* end = nullptr;
            const unsigned long numeric = std::strtoul(device_id.c_str(), &end, 10);
            if (end != device_id.c_str() && *end == '\0') {
                return static_cast<SDL_AudioDeviceID>(numeric);
            }

            for (const auto id : playback_devices()) {
                if (device_name(id) == device_id) {
                    return id;
                }
            }
            THROW_RUNTIME("No playback device named '" + device_id + "'");
        }
#if defined(AFQUEUE_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(AFQUEUE_COMPILER_CLANG)
# pragma clang diagnostic pop
#endif
    }

    sdl3_backend::~sdl3_backend() {
        shutdown();
    }

    void sdl3_backend::require_initialized(const char* operation) const {
        if (!m_initialized) {
            THROW_RUNTIME(std::string(operation) + ": SDL3 backend is not initialized");
        }
    }

    SDL_AudioDeviceID sdl3_backend::lookup(uint32_t device_handle) const {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_open_devices.find(device_handle);
        return it == m_open_devices.end() ? 0 : it->second.sdl_id;
    }

    bool SDLCALL sdl3_backend::watch_events(void* userdata, SDL_Event* event) {
        if (event && event->type == SDL_EVENT_AUDIO_DEVICE_REMOVED && !event->adevice.recording) {
            static_cast<sdl3_backend*>(userdata)->mark_lost(event->adevice.which);
        }
        return true;
    }

    void sdl3_backend::mark_lost(SDL_AudioDeviceID sdl_id) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);
        for (auto& entry : m_open_devices) {
            if (entry.second.sdl_id == sdl_id) {
                entry.second.lost = true;
            }
        }
    }

    void sdl3_backend::init() {
        if (m_initialized) {
            THROW_RUNTIME("SDL3 backend already initialized");
        }
        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            THROW_RUNTIME("SDL_InitSubSystem(AUDIO) failed: " + last_sdl_error());
        }
        if (!SDL_AddEventWatch(&sdl3_backend::watch_events, this)) {
            LOG_WARN("sdl3_backend", "Device removal will go unnoticed: ", last_sdl_error());
        }
        const char* driver = SDL_GetCurrentAudioDriver();
        LOG_INFO("sdl3_backend", "Audio driver: ", driver ? driver : "none");
        m_initialized = true;
    }

    void sdl3_backend::shutdown() {
        if (!m_initialized) {
            return;
        }
        SDL_RemoveEventWatch(&sdl3_backend::watch_events, this);

        std::map<uint32_t, open_device_entry> devices;
        {
            std::lock_guard<std::mutex> lock(m_devices_mutex);
            devices.swap(m_open_devices);
        }
        for (const auto& entry : devices) {
            SDL_CloseAudioDevice(entry.second.sdl_id);
        }
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_initialized = false;
        LOG_DEBUG("sdl3_backend", "Audio subsystem shut down");
    }

    std::string sdl3_backend::get_name() const {
        return "SDL3";
    }

    bool sdl3_backend::is_initialized() const {
        return m_initialized;
    }

    std::vector<device_info> sdl3_backend::enumerate_devices() {
        require_initialized("enumerate_devices");

        std::vector<device_info> result;
        const auto ids = playback_devices();
        for (std::size_t i = 0; i < ids.size(); i++) {
            SDL_AudioSpec native;
            if (!SDL_GetAudioDeviceFormat(ids[i], &native, nullptr)) {
                LOG_WARN("sdl3_backend", "Skipping device ", ids[i], ": ", last_sdl_error());
                continue;
            }
            device_info info;
            info.name = device_name(ids[i]);
            info.id = std::to_string(ids[i]);
            // SDL lists the system default first
            info.is_default = i == 0;
            info.channels = static_cast<channels_t>(native.channels);
            info.sample_rate = static_cast<sample_rate_t>(native.freq);
            result.push_back(std::move(info));
        }
        return result;
    }

    uint32_t sdl3_backend::open_device(const std::string& device_id,
                                       const audio_spec& spec,
                                       audio_spec& obtained_spec) {
        require_initialized("open_device");

        SDL_AudioSpec wanted;
        SDL_zero(wanted);
        wanted.format = sdl_format_of(spec.format);
        wanted.channels = spec.channels;
        wanted.freq = static_cast<int>(spec.freq);

        const SDL_AudioDeviceID sdl_id = SDL_OpenAudioDevice(resolve_device(device_id), &wanted);
        if (sdl_id == 0) {
            THROW_RUNTIME("SDL_OpenAudioDevice failed: " + last_sdl_error());
        }

        SDL_AudioSpec actual;
        if (!SDL_GetAudioDeviceFormat(sdl_id, &actual, nullptr)) {
            const auto err = last_sdl_error();
            SDL_CloseAudioDevice(sdl_id);
            THROW_RUNTIME("SDL_GetAudioDeviceFormat failed: " + err);
        }
        obtained_spec = spec_of(actual);

        uint32_t handle;
        {
            std::lock_guard<std::mutex> lock(m_devices_mutex);
            handle = m_next_handle++;
            m_open_devices[handle] = open_device_entry{sdl_id, false};
        }

        LOG_INFO("sdl3_backend", "Opened '", device_name(sdl_id), "' at ",
                 obtained_spec.freq, " Hz, ", static_cast<int>(obtained_spec.channels), " channels");
        return handle;
    }

    void sdl3_backend::close_device(uint32_t device_handle) {
        SDL_AudioDeviceID sdl_id = 0;
        {
            std::lock_guard<std::mutex> lock(m_devices_mutex);
            auto it = m_open_devices.find(device_handle);
            if (it == m_open_devices.end()) {
                return;
            }
            sdl_id = it->second.sdl_id;
            m_open_devices.erase(it);
        }
        SDL_CloseAudioDevice(sdl_id);
    }

    bool sdl3_backend::pause_device(uint32_t device_handle) {
        const auto sdl_id = lookup(device_handle);
        return sdl_id != 0 && SDL_PauseAudioDevice(sdl_id);
    }

    bool sdl3_backend::resume_device(uint32_t device_handle) {
        const auto sdl_id = lookup(device_handle);
        return sdl_id != 0 && SDL_ResumeAudioDevice(sdl_id);
    }

    bool sdl3_backend::is_device_paused(uint32_t device_handle) {
        const auto sdl_id = lookup(device_handle);
        if (sdl_id == 0) {
            THROW_RUNTIME("Unknown device handle " + std::to_string(device_handle));
        }
        return SDL_AudioDevicePaused(sdl_id);
    }

    bool sdl3_backend::is_device_lost(uint32_t device_handle) {
        // Hotplug events are queued until the event loop is pumped
        SDL_PumpEvents();
        SDL_FlushEvents(SDL_EVENT_AUDIO_DEVICE_ADDED, SDL_EVENT_AUDIO_DEVICE_FORMAT_CHANGED);

        std::lock_guard<std::mutex> lock(m_devices_mutex);
        auto it = m_open_devices.find(device_handle);
        return it != m_open_devices.end() && it->second.lost;
    }

    std::unique_ptr<audio_stream_interface> sdl3_backend::create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) {
        const auto sdl_id = lookup(device_handle);
        if (sdl_id == 0) {
            THROW_RUNTIME("Unknown device handle " + std::to_string(device_handle));
        }
        return std::make_unique<sdl3_audio_stream>(sdl_id, spec, sdl_format_of(spec.format),
                                                   callback, userdata);
    }
} // namespace afqueue
