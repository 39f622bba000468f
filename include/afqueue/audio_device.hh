#ifndef AFQUEUE_AUDIO_DEVICE_HH
#define AFQUEUE_AUDIO_DEVICE_HH

#include <memory>
#include <string>
#include <afqueue/sdk/types.hh>
#include <afqueue/sdk/audio_backend.hh>

namespace afqueue {

    /**
     * @class render_source
     * @brief Producer of interleaved float frames for a running stream
     *
     * render() is called on the backend's audio thread. Implementations must
     * not block, allocate or throw; @p out always has room for
     * frames * channels samples of the spec the stream was started with.
     */
    class render_source {
        public:
            virtual ~render_source() = default;
            virtual void render(float* out, size_t frames) noexcept = 0;
    };

    /**
     * @class audio_device
     * @brief An opened playback device and its current stream
     *
     * The device is opened once per run. Each track gets its own stream via
     * start(), in the track's native format (32-bit float, the track's
     * channel count and rate); the backend converts to the device format.
     *
     * Device open failures throw device_error. So do failures to create a
     * stream mid-run; both are fatal for the player. A device disconnected
     * during playback is reported by is_lost(), which the player polls.
     *
     * @code
     * audio_device device(create_sdl3_backend(), "");
     * device.start(queue, audio_spec{audio_format::f32le, 2, 44100});
     * ...
     * device.stop();
     * @endcode
     */
    class audio_device {
        public:
            /**
             * @brief Initialize the backend if needed and open a device
             * @param device_id Backend specific id, empty for the default device
             * @throws device_error if the backend or the device cannot be opened
             */
            audio_device(std::shared_ptr<audio_backend> backend, const std::string& device_id);
            ~audio_device();

            audio_device(const audio_device&) = delete;
            audio_device& operator=(const audio_device&) = delete;

            /**
             * @brief Replace the current stream with one pulling from @p source
             * @throws device_error if the stream cannot be created or started
             */
            void start(render_source& source, const audio_spec& spec);

            /**
             * @brief Destroy the current stream; no render call is running afterwards
             */
            void stop();

            bool pause();
            bool resume();

            [[nodiscard]] bool is_streaming() const;

            /// True once the backend reported the device as disconnected
            [[nodiscard]] bool is_lost() const;

            [[nodiscard]] std::string get_backend_name() const;

            /// Format the device was opened with
            [[nodiscard]] const audio_spec& get_device_spec() const;

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };
}

#endif
