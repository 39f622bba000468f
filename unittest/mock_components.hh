#ifndef AFQUEUE_MOCK_COMPONENTS_HH
#define AFQUEUE_MOCK_COMPONENTS_HH

#include <afqueue/decoder_feed.hh>
#include <afqueue/error.hh>
#include <afqueue/sdk/decoder.hh>
#include <afqueue/sdk/decoders_registry.hh>
#include <afqueue/sdk/io_stream.hh>
#include <afqueue/sdk/types.hh>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace afqueue::test {

// io_stream over an owned byte vector
class memory_io_stream : public io_stream {
public:
    explicit memory_io_stream(std::vector<uint8_t> data)
        : m_data(std::move(data)), m_position(0), m_is_open(true) {}

    size_t read(void* ptr, size_t size_bytes) override {
        if (!m_is_open) return 0;

        const size_t available = m_data.size() - m_position;
        const size_t to_read = std::min(available, size_bytes);
        if (to_read > 0) {
            std::memcpy(ptr, m_data.data() + m_position, to_read);
            m_position += to_read;
        }
        return to_read;
    }

    int64_t seek(int64_t offset, seek_origin whence) override {
        if (!m_is_open) return -1;

        int64_t new_pos = static_cast<int64_t>(m_position);
        switch (whence) {
            case seek_origin::set:
                new_pos = offset;
                break;
            case seek_origin::cur:
                new_pos = static_cast<int64_t>(m_position) + offset;
                break;
            case seek_origin::end:
                new_pos = static_cast<int64_t>(m_data.size()) + offset;
                break;
        }
        if (new_pos < 0 || new_pos > static_cast<int64_t>(m_data.size())) {
            return -1;
        }
        m_position = static_cast<size_t>(new_pos);
        return new_pos;
    }

    int64_t tell() override {
        return m_is_open ? static_cast<int64_t>(m_position) : -1;
    }

    int64_t get_size() override {
        return m_is_open ? static_cast<int64_t>(m_data.size()) : -1;
    }

    void close() override {
        m_is_open = false;
    }

    bool is_open() const override {
        return m_is_open;
    }

private:
    std::vector<uint8_t> m_data;
    size_t m_position;
    bool m_is_open;
};

// Header of a synthetic track understood by test_decoder:
// "AFQT", rate (u32 LE), channels (u8), frames (u32 LE), fail_at (u32 LE)
constexpr uint32_t NO_FAILURE = 0xFFFFFFFFu;
constexpr size_t TEST_HEADER_SIZE = 17;
constexpr const char* TEST_TRACK_TITLE = "Synthetic ramp";

inline void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; i++) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

inline uint32_t get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

inline std::vector<uint8_t> make_test_track(sample_rate_t rate, channels_t channels,
                                            uint32_t frames, uint32_t fail_at = NO_FAILURE) {
    std::vector<uint8_t> out = {'A', 'F', 'Q', 'T'};
    put_u32(out, rate);
    out.push_back(channels);
    put_u32(out, frames);
    put_u32(out, fail_at);
    return out;
}

// Value of frame @p index in every channel of a synthetic track
inline float test_sample(size_t index) {
    return static_cast<float>(index % 1000) / 1000.0f;
}

// Decoder for synthetic tracks: frame i carries test_sample(i) on all channels
class test_decoder : public decoder {
public:
    using call_counter_t = std::shared_ptr<std::atomic<std::size_t>>;

    test_decoder() = default;
    explicit test_decoder(call_counter_t decode_calls)
        : m_decode_calls(std::move(decode_calls)) {}

    static bool accept(io_stream* rwops) {
        char magic[4] = {};
        if (!rwops || rwops->read(magic, 4) != 4) {
            return false;
        }
        return std::memcmp(magic, "AFQT", 4) == 0;
    }

    const char* get_name() const override {
        return "Test Decoder";
    }

    void open(io_stream* rwops) override {
        uint8_t header[TEST_HEADER_SIZE] = {};
        if (!rwops || rwops->read(header, sizeof(header)) != sizeof(header)) {
            throw decoder_error("truncated test track header");
        }
        m_rate = get_u32(header + 4);
        m_channels = header[8];
        m_total_frames = get_u32(header + 9);
        m_fail_at = get_u32(header + 13);
        if (m_rate == 0 || m_channels == 0) {
            throw decoder_error("test track declares an empty format");
        }
        set_is_open(true);
    }

    channels_t get_channels() const override {
        return m_channels;
    }

    sample_rate_t get_rate() const override {
        return m_rate;
    }

    std::chrono::microseconds duration() const override {
        return std::chrono::microseconds(static_cast<int64_t>(m_total_frames) * 1000000 / m_rate);
    }

    metadata_t get_metadata() const override {
        return {{"title", TEST_TRACK_TITLE}};
    }

protected:
    size_t do_decode(float* buf, size_t len, bool& call_again) override {
        if (m_decode_calls) {
            m_decode_calls->fetch_add(1);
        }
        if (m_fail_at != NO_FAILURE && m_current_frame >= m_fail_at) {
            throw decoder_error("corrupt frame in test track");
        }
        size_t frames = std::min<size_t>(len / m_channels, m_total_frames - m_current_frame);
        if (m_fail_at != NO_FAILURE) {
            frames = std::min<size_t>(frames, m_fail_at - m_current_frame);
        }
        for (size_t i = 0; i < frames; i++) {
            for (channels_t ch = 0; ch < m_channels; ch++) {
                buf[i * m_channels + ch] = test_sample(m_current_frame + i);
            }
        }
        m_current_frame += frames;
        call_again = m_current_frame < m_total_frames;
        return frames * m_channels;
    }

private:
    sample_rate_t m_rate = 0;
    channels_t m_channels = 0;
    uint32_t m_total_frames = 0;
    uint32_t m_fail_at = NO_FAILURE;
    size_t m_current_frame = 0;
    call_counter_t m_decode_calls;
};

inline void register_test_decoder(decoders_registry& registry, int priority = 0,
                                  test_decoder::call_counter_t decode_calls = nullptr) {
    registry.register_decoder(
        test_decoder::accept,
        [decode_calls]() { return std::make_unique<test_decoder>(decode_calls); },
        priority);
}

// In-memory file system handed to decoder_feed as its stream opener
class media_library {
public:
    void add(const std::string& path, std::vector<uint8_t> bytes) {
        m_files[path] = std::move(bytes);
    }

    decoder_feed::stream_opener_t opener() const {
        return [this](const std::string& path) -> std::unique_ptr<io_stream> {
            auto it = m_files.find(path);
            if (it == m_files.end()) {
                return nullptr;
            }
            return std::make_unique<memory_io_stream>(it->second);
        };
    }

private:
    std::map<std::string, std::vector<uint8_t>> m_files;
};

} // namespace afqueue::test

#endif
