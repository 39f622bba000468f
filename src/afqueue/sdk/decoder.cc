#include <afqueue/sdk/decoder.hh>
#include <afqueue/error.hh>

#include <cmath>
#include <memory>
#include <string>

namespace afqueue {
    struct decoder::impl final {
        bool m_is_open = false;
        bool m_finished = false;
    };

    decoder::decoder()
        : m_pimpl(std::make_unique <impl>()) {
    }

    decoder::~decoder() = default;

    bool decoder::is_open() const {
        return m_pimpl->m_is_open;
    }

    size_t decoder::decode(float buf[], size_t len, bool& call_again) {
        if (!is_open()) {
            throw decoder_error("decode called on a decoder that is not open");
        }
        if (m_pimpl->m_finished || len == 0 || !buf) {
            call_again = !m_pimpl->m_finished;
            return 0;
        }

        // Only whole frames are handed out
        const auto channels = static_cast <size_t>(get_channels());
        if (channels == 0) {
            throw decoder_error(std::string("decoder reports zero channels: ") + get_name());
        }
        len -= len % channels;

        const auto got = do_decode(buf, len, call_again);
        if (!call_again || got == 0) {
            m_pimpl->m_finished = true;
        }

        // Some codecs overshoot slightly on clipped material
        for (size_t i = 0; i < got; i++) {
            if (!std::isfinite(buf[i])) {
                buf[i] = 0.0f;
            } else if (buf[i] > 1.0f) {
                buf[i] = 1.0f;
            } else if (buf[i] < -1.0f) {
                buf[i] = -1.0f;
            }
        }
        return got;
    }

    decoder::metadata_t decoder::get_metadata() const {
        return {};
    }

    void decoder::set_is_open(bool f) {
        m_pimpl->m_is_open = f;
    }
}
