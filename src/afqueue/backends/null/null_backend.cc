#include <afqueue/backends/null/null_backend.hh>
#include <afqueue/sdk/audio_backend.hh>
#include <failsafe/failsafe.hh>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace afqueue {
    namespace {
        constexpr auto PERIOD = std::chrono::milliseconds(10);

        class null_audio_stream : public audio_stream_interface {
        public:
            null_audio_stream(const audio_spec& spec, audio_callback_t callback, void* userdata,
                              std::atomic<bool>& device_paused)
                : m_callback(callback),
                  m_userdata(userdata),
                  m_device_paused(device_paused),
                  m_period(static_cast<size_t>(spec.freq) / 100 * spec.channels
                           * audio_format_byte_size(spec.format)) {
                bind_to_device();
            }

            ~null_audio_stream() override {
                unbind_from_device();
            }

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
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_thread.joinable() || !m_callback) {
                    return false;
                }
                m_running = true;
                m_thread = std::thread([this] { clock_loop(); });
                return true;
            }

            void unbind_from_device() override {
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_running = false;
                }
                m_cv.notify_all();
                if (m_thread.joinable()) {
                    m_thread.join();
                }
            }

        private:
            void clock_loop() {
                auto next = std::chrono::steady_clock::now();
                std::unique_lock<std::mutex> lock(m_mutex);
                while (m_running) {
                    next += PERIOD;
                    if (!m_paused && !m_device_paused && !m_period.empty()) {
                        lock.unlock();
                        m_callback(m_userdata, m_period.data(), static_cast<int>(m_period.size()));
                        lock.lock();
                    }
                    m_cv.wait_until(lock, next, [this] { return !m_running; });
                }
            }

            audio_callback_t m_callback;
            void* m_userdata;
            std::atomic<bool>& m_device_paused;
            std::vector<uint8_t> m_period;
            std::atomic<bool> m_paused{false};
            bool m_running = false;
            std::mutex m_mutex;
            std::condition_variable m_cv;
            std::thread m_thread;
        };

        class null_audio_backend : public audio_backend {
        public:
            void init() override {
                if (m_initialized) {
                    THROW_RUNTIME("Null backend already initialized");
                }
                m_initialized = true;
            }

            void shutdown() override {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_devices.clear();
                m_initialized = false;
            }

            std::string get_name() const override {
                return "Null";
            }

            bool is_initialized() const override {
                return m_initialized;
            }

            std::vector<device_info> enumerate_devices() override {
                return {device_info{"Null Output", "null", true, 2, 44100}};
            }

            uint32_t open_device(const std::string& device_id,
                                 const audio_spec& spec,
                                 audio_spec& obtained_spec) override {
                if (!m_initialized) {
                    THROW_RUNTIME("Backend not initialized");
                }
                if (!device_id.empty() && device_id != "default" && device_id != "null") {
                    THROW_RUNTIME("Unknown audio device: " + device_id);
                }
                obtained_spec = spec;
                std::lock_guard<std::mutex> lock(m_mutex);
                const auto handle = m_next_handle++;
                m_devices[handle] = std::make_unique<std::atomic<bool>>(true);
                return handle;
            }

            void close_device(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_devices.erase(device_handle);
            }

            bool pause_device(uint32_t device_handle) override {
                return set_paused(device_handle, true);
            }

            bool resume_device(uint32_t device_handle) override {
                return set_paused(device_handle, false);
            }

            bool is_device_paused(uint32_t device_handle) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_devices.find(device_handle);
                if (it == m_devices.end()) {
                    THROW_RUNTIME("Invalid device handle");
                }
                return it->second->load();
            }

            bool is_device_lost(uint32_t) override {
                return false;
            }

            std::unique_ptr<audio_stream_interface> create_stream(
                uint32_t device_handle,
                const audio_spec& spec,
                audio_callback_t callback,
                void* userdata) override {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_devices.find(device_handle);
                if (it == m_devices.end()) {
                    THROW_RUNTIME("Invalid device handle");
                }
                return std::make_unique<null_audio_stream>(spec, callback, userdata, *it->second);
            }

        private:
            bool set_paused(uint32_t device_handle, bool paused) {
                std::lock_guard<std::mutex> lock(m_mutex);
                auto it = m_devices.find(device_handle);
                if (it == m_devices.end()) {
                    return false;
                }
                it->second->store(paused);
                return true;
            }

            bool m_initialized = false;
            std::mutex m_mutex;
            std::map<uint32_t, std::unique_ptr<std::atomic<bool>>> m_devices;
            uint32_t m_next_handle = 1;
        };
    }

    std::unique_ptr<audio_backend> create_null_backend() {
        return std::make_unique<null_audio_backend>();
    }
} // namespace afqueue
