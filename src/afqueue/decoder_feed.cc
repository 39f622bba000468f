#include <afqueue/decoder_feed.hh>
#include <afqueue/sample_buffer.hh>
#include <afqueue/sdk/decoder.hh>
#include <afqueue/sdk/decoders_registry.hh>
#include <afqueue/error.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <exception>
#include <ostream>

namespace afqueue {

std::ostream& operator<<(std::ostream& os, const format_info& info) {
    os << info.sample_rate << " Hz, "
       << static_cast<int>(info.channels) << " ch, "
       << info.bits_per_sample << "-bit float";
    if (!info.decoder_name.empty()) {
        os << ", " << info.decoder_name;
    }
    return os;
}

decoder_feed::decoder_feed(const decoders_registry& registry, stream_opener_t opener)
    : m_registry(registry),
      m_opener(opener ? std::move(opener) : stream_opener_t(&io_from_file)) {
}

decoder_feed::~decoder_feed() {
    close();
}

format_info decoder_feed::open(const std::string& path) {
    close();

    auto stream = m_opener(path);
    if (!stream || !stream->is_open()) {
        throw io_error("Cannot open file: " + path);
    }

    auto dec = m_registry.find_decoder(stream.get());
    if (!dec) {
        throw decoder_error("Unrecognised audio format: " + path);
    }

    try {
        dec->open(stream.get());
    } catch (const decoder_error&) {
        throw;
    } catch (const std::exception& e) {
        throw decoder_error(std::string(dec->get_name()) + " failed to open " + path + ": " + e.what());
    }

    format_info info;
    info.sample_rate = dec->get_rate();
    info.channels = dec->get_channels();
    info.duration = dec->duration();
    info.decoder_name = dec->get_name();
    info.tags = dec->get_metadata();
    if (info.sample_rate == 0 || info.channels == 0) {
        throw decoder_error("Invalid stream format in " + path);
    }

    m_stream = std::move(stream);
    m_decoder = std::move(dec);
    m_path = path;
    m_format = info;
    m_frames_read = 0;
    m_at_end = false;

    LOG_INFO("decoder_feed", "Opened ", path, ": ", info);
    return info;
}

std::size_t decoder_feed::read_frames(sample_buffer& buf, std::size_t max_frames) {
    buf.length = 0;
    buf.frames = 0;
    if (!m_decoder || m_at_end) {
        return 0;
    }

    const std::size_t channels = m_format.channels;
    const auto frames = std::min(max_frames, buf.capacity() / channels);
    const std::size_t wanted = frames * channels;

    std::size_t got = 0;
    try {
        while (got < wanted) {
            bool call_again = true;
            const auto n = m_decoder->decode(buf.samples.data() + got, wanted - got, call_again);
            got += n;
            if (n == 0 || !call_again) {
                m_at_end = true;
                break;
            }
        }
    } catch (const decoder_error&) {
        throw;
    } catch (const std::exception& e) {
        throw decoder_error("Decoding " + m_path + " failed: " + e.what());
    }

    // A trailing partial frame is dropped
    got -= got % channels;
    buf.length = got;
    buf.frames = got / channels;
    m_frames_read += buf.frames;
    return buf.frames;
}

void decoder_feed::close() {
    m_decoder.reset();
    if (m_stream) {
        m_stream->close();
        m_stream.reset();
    }
    m_at_end = false;
}

bool decoder_feed::is_open() const {
    return m_decoder != nullptr;
}

bool decoder_feed::at_end() const {
    return m_at_end;
}

const std::string& decoder_feed::path() const {
    return m_path;
}

const format_info& decoder_feed::format() const {
    return m_format;
}

uint64_t decoder_feed::frames_read() const {
    return m_frames_read;
}

} // namespace afqueue
