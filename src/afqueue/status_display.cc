#include <afqueue/status_display.hh>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace afqueue {

namespace {
    constexpr const char* CLEAR_SCREEN = "\x1b[2J\x1b[1;1H";
    constexpr const char* CLEAR_EOL = "\x1b[K";
    constexpr const char* CRLF = "\r\n";
    constexpr const char* METER_CELL = "\xe2\x96\x88";
    constexpr std::size_t MAX_METER_LINES = 8;
}

std::string format_time(std::chrono::milliseconds t) {
    const auto total_s = std::max<long long>(0, t.count() / 1000);
    const auto h = total_s / 3600;
    const auto m = (total_s / 60) % 60;
    const auto s = total_s % 60;

    std::ostringstream os;
    os << std::setfill('0');
    if (h > 0) {
        os << h << ':' << std::setw(2) << m;
    } else {
        os << m;
    }
    os << ':' << std::setw(2) << s;
    return os.str();
}

std::string format_status_line(const status_snapshot& s) {
    std::ostringstream os;
    os << '[' << s.status << "] " << format_time(s.elapsed);
    if (s.duration.count() > 0) {
        os << " / " << format_time(std::chrono::duration_cast<std::chrono::milliseconds>(s.duration));
    }
    os << "  vol " << static_cast<int>(std::lround(s.gain * 100.0f)) << '%';
    if (s.underruns > 0) {
        os << "  underruns " << s.underruns;
    }
    return os.str();
}

std::string format_meter(float level, std::size_t width) {
    const auto clamped = std::clamp(std::isfinite(level) ? level : 0.0f, 0.0f, 1.0f);
    const auto cells = static_cast<std::size_t>(clamped * static_cast<float>(width));
    std::string bar;
    for (std::size_t i = 0; i < cells; i++) {
        bar += METER_CELL;
    }
    return bar;
}

status_display::status_display(std::ostream& out, bool ansi)
    : m_out(out), m_ansi(ansi) {
}

void status_display::set_width(std::size_t columns) {
    if (columns > 0) {
        m_width = columns;
    }
}

void status_display::resize(std::size_t columns) {
    if (columns == 0 || columns == m_width) {
        return;
    }
    m_width = columns;
    if (m_ansi && m_header) {
        write_header(*m_header);
    }
}

void status_display::set_width_source(width_source_t source) {
    m_width_source = std::move(source);
}

std::size_t status_display::width() const {
    return m_width;
}

void status_display::show_track(std::size_t index, std::size_t total,
                                const std::string& path, const format_info& fmt) {
    m_header = track_header{index, total, path, fmt};
    write_header(*m_header);
}

void status_display::write_header(const track_header& h) {
    const auto& fmt = h.fmt;
    if (m_ansi) {
        m_out << CLEAR_SCREEN;
    }
    m_out << '(' << h.index + 1 << '/' << h.total << ") " << h.path << CRLF
          << "Properties:" << CRLF
          << "decoder: " << fmt.decoder_name << CRLF
          << "sample rate: " << fmt.sample_rate << " Hz" << CRLF
          << "channels: " << static_cast<int>(fmt.channels) << CRLF
          << "bit depth: " << fmt.bits_per_sample << CRLF;
    if (fmt.duration.count() > 0) {
        m_out << "duration: "
              << format_time(std::chrono::duration_cast<std::chrono::milliseconds>(fmt.duration)) << CRLF;
    }
    for (const auto& tag : fmt.tags) {
        m_out << tag.first << ": " << tag.second << CRLF;
    }
    m_out << "keys: n next, p pause, [ quieter, ] louder, q quit" << CRLF;
    m_drawn_lines = 0;
    m_out.flush();
}

void status_display::show_message(const std::string& msg) {
    if (m_ansi && m_drawn_lines > 0) {
        // Drop the status block; it is redrawn below the message
        if (m_drawn_lines > 1) {
            m_out << "\x1b[" << m_drawn_lines - 1 << 'A';
        }
        m_out << '\r' << "\x1b[J";
        m_drawn_lines = 0;
    }
    m_out << msg << CRLF;
    m_out.flush();
}

void status_display::update(const status_snapshot& s) {
    if (m_width_source) {
        if (const auto columns = m_width_source()) {
            resize(*columns);
        }
    }
    if (!m_ansi) {
        return;
    }
    // Back to the first line of the previous block
    if (m_drawn_lines > 1) {
        m_out << "\x1b[" << m_drawn_lines - 1 << 'A';
    }
    m_out << '\r' << format_status_line(s) << CLEAR_EOL;

    const auto bar_width = m_width > 8 ? m_width - 8 : m_width;
    const auto meters = std::min(s.levels.size(), MAX_METER_LINES);
    for (std::size_t i = 0; i < meters; i++) {
        m_out << CRLF << "ch" << i + 1 << ' ' << format_meter(s.levels[i], bar_width) << CLEAR_EOL;
    }
    m_drawn_lines = meters + 1;
    m_out.flush();
}

void status_display::finish() {
    if (m_drawn_lines > 0) {
        m_out << CRLF;
        m_drawn_lines = 0;
    }
    m_out.flush();
}

} // namespace afqueue
