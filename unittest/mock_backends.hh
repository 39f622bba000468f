#ifndef AFQUEUE_MOCK_BACKENDS_HH
#define AFQUEUE_MOCK_BACKENDS_HH

#include <afqueue/sdk/audio_backend.hh>
#include <afqueue/sdk/audio_stream_interface.hh>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace afqueue::test {

    class mock_backend;

    // Stream that only plays when the test pumps it
    class mock_stream : public audio_stream_interface {
        public:
            mock_stream(mock_backend& owner, const audio_spec& spec,
                        audio_callback_t callback, void* userdata);
            ~mock_stream() override;

            void clear() override {}

            bool pause() override {
                m_paused = true;
                return true;
            }

            bool resume() override {
                m_paused = false;
                return true;
            }

            bool is_paused() const override {
                return m_paused;
            }

            bool bind_to_device() override {
                m_bound = true;
                return true;
            }

            void unbind_from_device() override {
                m_bound = false;
            }

            // Run one device callback of @p frames frames and return the samples
            std::vector<float> pump(size_t frames) {
                std::vector<float> out(frames * m_spec.channels, -2.0f);
                if (m_bound && m_callback) {
                    m_callback(m_userdata, reinterpret_cast<uint8_t*>(out.data()),
                               static_cast<int>(out.size() * sizeof(float)));
                }
                return out;
            }

            const audio_spec& spec() const {
                return m_spec;
            }

        private:
            mock_backend& m_owner;
            audio_spec m_spec;
            audio_callback_t m_callback;
            void* m_userdata;
            std::atomic<bool> m_paused{false};
            std::atomic<bool> m_bound{true};
    };

    class mock_backend : public audio_backend {
        public:
            // Statistics for testing
            std::atomic<int> init_calls{0};
            std::atomic<int> shutdown_calls{0};
            std::atomic<int> open_device_calls{0};
            std::atomic<int> close_device_calls{0};
            std::atomic<int> create_stream_calls{0};
            std::atomic<int> pause_calls{0};
            std::atomic<int> resume_calls{0};

            // Error injection
            bool fail_init{false};
            bool fail_open_device{false};
            bool fail_create_stream{false};

            // Simulate the device being unplugged
            void lose_device() {
                m_device_lost = true;
            }

            void init() override {
                init_calls++;
                if (fail_init) {
                    throw std::runtime_error("Mock backend init failed");
                }
                m_initialized = true;
            }

            void shutdown() override {
                shutdown_calls++;
                m_initialized = false;
            }

            std::string get_name() const override {
                return "Mock";
            }

            bool is_initialized() const override {
                return m_initialized;
            }

            std::vector<device_info> enumerate_devices() override {
                return {device_info{"Mock Default Device", "mock_default", true, 2, 44100}};
            }

            uint32_t open_device(const std::string& device_id,
                                 const audio_spec& spec,
                                 audio_spec& obtained_spec) override {
                open_device_calls++;
                if (fail_open_device) {
                    throw std::runtime_error("Mock device open failed: " + device_id);
                }
                obtained_spec = spec;
                m_device_paused = true;
                return 1;
            }

            void close_device(uint32_t) override {
                close_device_calls++;
            }

            bool pause_device(uint32_t) override {
                pause_calls++;
                m_device_paused = true;
                return true;
            }

            bool resume_device(uint32_t) override {
                resume_calls++;
                m_device_paused = false;
                return true;
            }

            bool is_device_paused(uint32_t) override {
                return m_device_paused;
            }

            bool is_device_lost(uint32_t) override {
                return m_device_lost;
            }

            std::unique_ptr<audio_stream_interface> create_stream(
                uint32_t,
                const audio_spec& spec,
                audio_callback_t callback,
                void* userdata) override {
                create_stream_calls++;
                if (fail_create_stream) {
                    throw std::runtime_error("Mock stream creation failed");
                }
                return std::make_unique<mock_stream>(*this, spec, callback, userdata);
            }

            // Most recently created stream that is still alive
            mock_stream* current_stream() {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_streams.empty() ? nullptr : m_streams.back();
            }

            size_t live_streams() {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_streams.size();
            }

        private:
            friend class mock_stream;

            void register_stream(mock_stream* s) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_streams.push_back(s);
            }

            void unregister_stream(mock_stream* s) {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (auto it = m_streams.begin(); it != m_streams.end(); ++it) {
                    if (*it == s) {
                        m_streams.erase(it);
                        break;
                    }
                }
            }

            bool m_initialized{false};
            std::atomic<bool> m_device_paused{true};
            std::atomic<bool> m_device_lost{false};
            std::mutex m_mutex;
            std::vector<mock_stream*> m_streams;
    };

    inline mock_stream::mock_stream(mock_backend& owner, const audio_spec& spec,
                                    audio_callback_t callback, void* userdata)
        : m_owner(owner), m_spec(spec), m_callback(callback), m_userdata(userdata) {
        m_owner.register_stream(this);
    }

    inline mock_stream::~mock_stream() {
        m_owner.unregister_stream(this);
    }

} // namespace afqueue::test

#endif
