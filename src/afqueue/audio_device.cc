#include <afqueue/audio_device.hh>
#include <afqueue/error.hh>
#include <failsafe/failsafe.hh>

#include <exception>

namespace afqueue {

struct audio_device::impl {
    std::shared_ptr<audio_backend> m_backend;
    bool m_owns_init = false;
    uint32_t m_handle = 0;
    bool m_opened = false;
    audio_spec m_device_spec;

    // Read on the audio thread; written only while no stream exists
    render_source* m_source = nullptr;
    size_t m_frame_bytes = 0;

    std::unique_ptr<audio_stream_interface> m_stream;

    static void trampoline(void* userdata, uint8_t* stream, int len) {
        auto* self = static_cast<impl*>(userdata);
        if (!self->m_source || self->m_frame_bytes == 0 || len <= 0) {
            return;
        }
        const auto frames = static_cast<size_t>(len) / self->m_frame_bytes;
        self->m_source->render(reinterpret_cast<float*>(stream), frames);
    }
};

audio_device::audio_device(std::shared_ptr<audio_backend> backend, const std::string& device_id)
    : m_pimpl(std::make_unique<impl>()) {
    if (!backend) {
        throw device_error("No audio backend");
    }
    m_pimpl->m_backend = std::move(backend);

    try {
        if (!m_pimpl->m_backend->is_initialized()) {
            m_pimpl->m_backend->init();
            m_pimpl->m_owns_init = true;
        }

        audio_spec wanted;
        m_pimpl->m_handle = m_pimpl->m_backend->open_device(device_id, wanted, m_pimpl->m_device_spec);
        m_pimpl->m_opened = true;
    } catch (const std::exception& e) {
        if (m_pimpl->m_owns_init) {
            m_pimpl->m_backend->shutdown();
        }
        if (dynamic_cast<const device_error*>(&e)) {
            throw;
        }
        throw device_error(std::string("Audio device initialisation failed: ") + e.what());
    }

    // Streams feed the device; keep it running
    if (!m_pimpl->m_backend->resume_device(m_pimpl->m_handle)) {
        LOG_WARN("audio_device", "Backend refused to resume device");
    }
    LOG_INFO("audio_device", "Opened ", m_pimpl->m_backend->get_name(), " device, ",
             m_pimpl->m_device_spec.freq, " Hz, ", static_cast<int>(m_pimpl->m_device_spec.channels),
             " channels");
}

audio_device::~audio_device() {
    stop();
    if (m_pimpl->m_opened) {
        m_pimpl->m_backend->close_device(m_pimpl->m_handle);
    }
    if (m_pimpl->m_owns_init) {
        m_pimpl->m_backend->shutdown();
    }
}

void audio_device::start(render_source& source, const audio_spec& spec) {
    stop();

    if (spec.format != audio_format::f32le || spec.channels == 0 || spec.freq == 0) {
        throw device_error("Unsupported stream format");
    }

    m_pimpl->m_source = &source;
    m_pimpl->m_frame_bytes = static_cast<size_t>(spec.channels) * audio_format_byte_size(spec.format);

    try {
        m_pimpl->m_stream = m_pimpl->m_backend->create_stream(m_pimpl->m_handle, spec,
                                                              &impl::trampoline, m_pimpl.get());
    } catch (const std::exception& e) {
        m_pimpl->m_source = nullptr;
        throw device_error(std::string("Failed to start audio stream: ") + e.what());
    }
    if (!m_pimpl->m_stream) {
        m_pimpl->m_source = nullptr;
        throw device_error("Backend returned no audio stream");
    }
    LOG_DEBUG("audio_device", "Stream started: ", spec);
}

void audio_device::stop() {
    if (m_pimpl->m_stream) {
        m_pimpl->m_stream->unbind_from_device();
        m_pimpl->m_stream.reset();
        LOG_DEBUG("audio_device", "Stream stopped");
    }
    m_pimpl->m_source = nullptr;
}

bool audio_device::pause() {
    return m_pimpl->m_backend->pause_device(m_pimpl->m_handle);
}

bool audio_device::resume() {
    return m_pimpl->m_backend->resume_device(m_pimpl->m_handle);
}

bool audio_device::is_streaming() const {
    return m_pimpl->m_stream != nullptr;
}

bool audio_device::is_lost() const {
    return m_pimpl->m_opened && m_pimpl->m_backend->is_device_lost(m_pimpl->m_handle);
}

std::string audio_device::get_backend_name() const {
    return m_pimpl->m_backend->get_name();
}

const audio_spec& audio_device::get_device_spec() const {
    return m_pimpl->m_device_spec;
}

} // namespace afqueue
