/**
 * @file audio_backend.hh
 * @brief Output device backend interface
 * @ingroup sdk
 */

#ifndef AFQUEUE_SDK_AUDIO_BACKEND_HH
#define AFQUEUE_SDK_AUDIO_BACKEND_HH

#include <string>
#include <memory>
#include <vector>
#include <ostream>
#include <afqueue/sdk/types.hh>
#include <afqueue/sdk/audio_stream_interface.hh>

namespace afqueue {

struct device_info {
    std::string name;           ///< Human-readable device name
    std::string id;             ///< Identifier accepted by open_device()
    bool is_default;            ///< True if this is the default device
    channels_t channels;        ///< Native channel count
    sample_rate_t sample_rate;  ///< Native sample rate in Hz
};

inline std::ostream& operator<<(std::ostream& os, const device_info& info) {
    os << "device_info{"
       << "name=\"" << info.name << "\", "
       << "id=\"" << info.id << "\", "
       << "default=" << (info.is_default ? "true" : "false") << ", "
       << "channels=" << static_cast<int>(info.channels) << ", "
       << "sample_rate=" << info.sample_rate
       << "}";
    return os;
}

/**
 * @brief Render callback type
 *
 * Called on the backend's audio thread with a byte buffer to fill in the
 * stream's format. @p len is in bytes. Must not block.
 */
using audio_callback_t = void (*)(void* userdata, uint8_t* stream, int len);

/**
 * @class audio_backend
 * @brief Abstract interface for audio output systems
 * @ingroup sdk
 *
 * A backend hands out opaque device handles. Devices are opened once and
 * streams are created on them; the backend converts each stream's format to
 * the device format.
 *
 * Initialization and device open report failure by throwing. Pause and
 * resume return false instead, since they are called on hot paths where the
 * caller decides how to react.
 *
 * @code
 * auto backend = create_sdl3_backend();
 * backend->init();
 *
 * audio_spec obtained;
 * uint32_t dev = backend->open_device("", audio_spec{}, obtained);
 * auto stream = backend->create_stream(dev, track_spec, &render, this);
 * backend->resume_device(dev);
 * @endcode
 */
class audio_backend {
public:
    virtual ~audio_backend() = default;

    // ========================================================================
    // Initialization and lifecycle management
    // ========================================================================

    /**
     * @brief Initialize the backend
     * @throws std::runtime_error if the audio subsystem is unavailable
     */
    virtual void init() = 0;

    /**
     * @brief Close all devices and release the audio subsystem
     */
    virtual void shutdown() = 0;

    [[nodiscard]] virtual std::string get_name() const = 0;

    [[nodiscard]] virtual bool is_initialized() const = 0;

    // ========================================================================
    // Device enumeration
    // ========================================================================

    virtual std::vector<device_info> enumerate_devices() = 0;

    // ========================================================================
    // Device management
    // ========================================================================

    /**
     * @brief Open a playback device
     * @param device_id Device identifier, empty for the default device
     * @param spec Desired device format
     * @param[out] obtained_spec Format actually used by the device
     * @return Backend specific device handle
     * @throws std::runtime_error if the device cannot be opened
     */
    virtual uint32_t open_device(const std::string& device_id,
                                 const audio_spec& spec,
                                 audio_spec& obtained_spec) = 0;

    virtual void close_device(uint32_t device_handle) = 0;

    // ========================================================================
    // Device control
    // ========================================================================

    virtual bool pause_device(uint32_t device_handle) = 0;

    virtual bool resume_device(uint32_t device_handle) = 0;

    virtual bool is_device_paused(uint32_t device_handle) = 0;

    /**
     * @brief Whether the device went away after it was opened
     *
     * A lost device stops pulling its streams. Backends learn about it
     * asynchronously (hotplug notifications); the flag stays set until the
     * handle is closed. Unknown handles report false.
     */
    virtual bool is_device_lost(uint32_t device_handle) = 0;

    // ========================================================================
    // Stream creation
    // ========================================================================

    /**
     * @brief Create a callback driven stream on an open device
     * @param spec Format of the data the callback produces
     * @throws std::runtime_error if the handle is invalid or creation fails
     */
    virtual std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) = 0;
};

} // namespace afqueue

#endif // AFQUEUE_SDK_AUDIO_BACKEND_HH
