/**
 * @file test_null_backend.cc
 * @brief Unit tests for the silent clock-driven backend
 */

#include <doctest/doctest.h>
#include <afqueue/backends/null/null_backend.hh>
#include <afqueue/sdk/audio_backend.hh>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace afqueue;
using namespace std::chrono_literals;

namespace {
    struct callback_counter {
        std::atomic<int> calls{0};
        std::atomic<int> last_len{0};

        static void callback(void* userdata, uint8_t*, int len) {
            auto* self = static_cast<callback_counter*>(userdata);
            self->calls++;
            self->last_len = len;
        }
    };
}

TEST_SUITE("NullBackend::Unit") {

    TEST_CASE("should_accept_only_its_own_devices") {
        auto backend = create_null_backend();
        backend->init();
        CHECK(backend->is_initialized());
        CHECK(backend->get_name() == "Null");
        CHECK(backend->enumerate_devices().size() == 1);

        audio_spec obtained;
        CHECK_NOTHROW(backend->open_device("", audio_spec{}, obtained));
        CHECK_NOTHROW(backend->open_device("null", audio_spec{}, obtained));
        CHECK_THROWS_AS(backend->open_device("hw:1", audio_spec{}, obtained), std::exception);
        backend->shutdown();
        CHECK_FALSE(backend->is_initialized());
    }

    TEST_CASE("should_clock_callbacks_only_while_the_device_runs") {
        auto backend = create_null_backend();
        backend->init();
        audio_spec obtained;
        const auto handle = backend->open_device("", audio_spec{}, obtained);
        CHECK(backend->is_device_paused(handle));

        callback_counter counter;
        auto stream = backend->create_stream(handle, audio_spec{audio_format::f32le, 2, 48000},
                                             &callback_counter::callback, &counter);
        std::this_thread::sleep_for(50ms);
        CHECK(counter.calls == 0);

        CHECK(backend->resume_device(handle));
        std::this_thread::sleep_for(100ms);
        CHECK(counter.calls > 0);
        // Ten milliseconds of 48 kHz stereo float
        CHECK(counter.last_len == 480 * 2 * 4);

        stream->unbind_from_device();
        const int after_stop = counter.calls;
        std::this_thread::sleep_for(50ms);
        CHECK(counter.calls == after_stop);

        stream.reset();
        backend->close_device(handle);
        backend->shutdown();
    }
}
