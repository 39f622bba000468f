#include <afqueue/buffer_queue.hh>
#include <afqueue/decoder_feed.hh>
#include <afqueue/playback_state.hh>
#include <afqueue/error.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>

namespace afqueue {

namespace {
    constexpr auto WORKER_POLL = std::chrono::milliseconds(10);

    void write_silence(float* out, std::size_t samples) noexcept {
        std::memset(out, 0, samples * sizeof(float));
    }
}

buffer_queue::buffer_queue(const playback_state& state,
                           std::size_t buffer_count,
                           std::size_t buffer_capacity,
                           std::chrono::milliseconds buffer_duration,
                           event_sink_t sink)
    : m_state(state),
      m_pool(buffer_count, buffer_capacity),
      m_buffer_duration(buffer_duration),
      m_sink(std::move(sink)),
      m_silence(1) {
    if (m_buffer_duration.count() <= 0) {
        throw config_error("buffer duration must be positive");
    }
}

buffer_queue::~buffer_queue() {
    stop();
}

void buffer_queue::start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_worker = std::thread([this] { worker_loop(); });
    LOG_DEBUG("buffer_queue", "Refill worker started");
}

void buffer_queue::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    wake_worker();
    if (m_worker.joinable()) {
        m_worker.join();
    }
    LOG_DEBUG("buffer_queue", "Refill worker stopped");
}

void buffer_queue::worker_loop() {
    while (m_running.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(m_work_mutex);
            m_work_cv.wait_for(lock, WORKER_POLL, [this] {
                return m_work_pending.exchange(false) || !m_running.load(std::memory_order_acquire);
            });
        }
        if (!m_running.load(std::memory_order_acquire)) {
            break;
        }
        service();
    }
}

void buffer_queue::wake_worker() noexcept {
    m_work_pending.store(true, std::memory_order_release);
    m_work_cv.notify_one();
}

std::unique_ptr<decoder_feed> buffer_queue::attach(std::unique_ptr<decoder_feed> feed) {
    std::lock_guard<std::mutex> lock(m_feed_mutex);

    if (feed) {
        const auto& fmt = feed->format();
        const std::size_t by_capacity = m_pool.capacity() / fmt.channels;
        const auto by_duration = static_cast<std::size_t>(
            static_cast<uint64_t>(fmt.sample_rate) * static_cast<uint64_t>(m_buffer_duration.count()) / 1000);
        const auto frames = std::min(by_capacity, by_duration);
        if (frames == 0) {
            throw decoder_error("Track format does not fit the buffer pool: " + feed->path());
        }
        m_frames_per_buffer = frames;
        m_rate = fmt.sample_rate;
        m_channels.store(fmt.channels, std::memory_order_release);
        if (by_capacity < by_duration) {
            LOG_DEBUG("buffer_queue", "Buffers hold ", frames, " frames, shorter than ",
                      m_buffer_duration.count(), " ms at ", fmt.sample_rate, " Hz");
        }
    } else {
        m_frames_per_buffer = 0;
        m_rate = 0;
        m_channels.store(0, std::memory_order_release);
    }

    // Stream is stopped; leftovers of the previous track go back to the pool
    m_playing = nullptr;
    m_cursor = 0;
    m_pool.reset_all();

    auto previous = std::move(m_feed);
    m_feed = std::move(feed);
    m_feed_epoch = m_state.epoch();
    m_next_sequence = 0;
    m_eot_mark.store(NO_MARK, std::memory_order_release);
    m_failed_mark.store(NO_MARK, std::memory_order_release);
    m_frames_played.store(0, std::memory_order_relaxed);
    return previous;
}

std::unique_ptr<decoder_feed> buffer_queue::detach() {
    return attach(nullptr);
}

std::size_t buffer_queue::prime() {
    const auto filled = refill();
    LOG_DEBUG("buffer_queue", "Primed ", filled, " of ", m_pool.size(), " buffers");
    return filled;
}

void buffer_queue::flush() {
    std::lock_guard<std::mutex> lock(m_feed_mutex);

    for (std::size_t i = 0; i < m_pool.size(); i++) {
        m_pool.transition(i, buffer_state::filled, buffer_state::free);
        m_pool.transition(i, buffer_state::consumed, buffer_state::free);
    }
    m_eot_mark.store(NO_MARK, std::memory_order_release);
    m_failed_mark.store(NO_MARK, std::memory_order_release);
    m_complete_pending.store(false, std::memory_order_release);
    m_frames_played.store(0, std::memory_order_relaxed);
    m_next_sequence = 0;
    LOG_DEBUG("buffer_queue", "Flushed, epoch is now ", m_state.epoch());
}

void buffer_queue::release(sample_buffer* b) noexcept {
    b->state.store(buffer_state::consumed, std::memory_order_release);
    b->state.store(buffer_state::free, std::memory_order_release);
    wake_worker();
}

sample_buffer* buffer_queue::take_oldest_filled(epoch_t epoch) noexcept {
    for (;;) {
        const auto next = m_pool.oldest_filled(epoch);
        if (!next) {
            return nullptr;
        }
        // Loses only against a concurrent flush
        if (m_pool.transition(*next, buffer_state::filled, buffer_state::playing)) {
            return &m_pool[*next];
        }
    }
}

sample_buffer* buffer_queue::on_buffer_consumed(sample_buffer* consumed) noexcept {
    if (consumed && consumed != &m_silence) {
        release(consumed);
    }

    const auto epoch = m_state.epoch();
    if (auto* next = take_oldest_filled(epoch)) {
        return next;
    }
    return after_empty_scan(epoch);
}

sample_buffer* buffer_queue::after_empty_scan(epoch_t epoch) noexcept {
    if (m_eot_mark.load(std::memory_order_acquire) == mark(epoch)) {
        // The final fill publishes its buffer before the mark
        if (auto* last = take_oldest_filled(epoch)) {
            return last;
        }
        if (m_complete_mark.exchange(mark(epoch), std::memory_order_acq_rel) != mark(epoch)) {
            m_complete_pending.store(true, std::memory_order_release);
            wake_worker();
        }
        return nullptr;
    }

    m_underruns.fetch_add(1, std::memory_order_relaxed);
    m_silence.epoch.store(epoch, std::memory_order_relaxed);
    wake_worker();
    return &m_silence;
}

void buffer_queue::render(float* out, std::size_t frames) noexcept {
    const std::size_t channels = m_channels.load(std::memory_order_acquire);
    if (channels == 0 || !m_state.is_playing()) {
        // Nothing is consumed, so resuming continues where this left off
        write_silence(out, frames * std::max<std::size_t>(channels, 1));
        for (auto& p : m_peaks) {
            p.store(0.0f, std::memory_order_relaxed);
        }
        return;
    }

    const std::size_t total = frames * channels;
    const float gain = m_state.gain();
    std::size_t written = 0;
    std::array<float, METER_CHANNELS> peaks{};

    while (written < total) {
        const auto epoch = m_state.epoch();
        if (m_playing && m_playing->epoch.load(std::memory_order_relaxed) != epoch) {
            m_stale_drops.fetch_add(1, std::memory_order_relaxed);
            release(m_playing);
            m_playing = nullptr;
            m_cursor = 0;
        }

        if (!m_playing || m_cursor >= m_playing->length) {
            m_playing = on_buffer_consumed(m_playing);
            m_cursor = 0;
            if (m_playing == nullptr || m_playing == &m_silence) {
                m_playing = nullptr;
                write_silence(out + written, total - written);
                break;
            }
            continue;
        }

        const auto n = std::min(total - written, m_playing->length - m_cursor);
        const float* src = m_playing->samples.data() + m_cursor;
        float* dst = out + written;
        for (std::size_t i = 0; i < n; i++) {
            dst[i] = src[i] * gain;
            const auto ch = (written + i) % channels;
            if (ch < METER_CHANNELS) {
                peaks[ch] = std::max(peaks[ch], std::fabs(dst[i]));
            }
        }
        m_cursor += n;
        written += n;
        m_frames_played.fetch_add(n / channels, std::memory_order_relaxed);
    }
    publish_peaks(peaks);
}

void buffer_queue::publish_peaks(const std::array<float, METER_CHANNELS>& peaks) noexcept {
    for (std::size_t i = 0; i < METER_CHANNELS; i++) {
        m_peaks[i].store(peaks[i], std::memory_order_relaxed);
    }
}

std::size_t buffer_queue::peak_levels(float* out, std::size_t max) const noexcept {
    const std::size_t channels = m_channels.load(std::memory_order_acquire);
    const auto n = std::min({channels, max, METER_CHANNELS});
    for (std::size_t i = 0; i < n; i++) {
        out[i] = m_peaks[i].load(std::memory_order_relaxed);
    }
    return n;
}

std::size_t buffer_queue::refill() {
    std::lock_guard<std::mutex> lock(m_feed_mutex);
    std::size_t filled = 0;
    while (fill_one_locked()) {
        filled++;
    }
    return filled;
}

bool buffer_queue::fill_one_locked() {
    if (!m_feed || !m_feed->is_open()) {
        return false;
    }
    const auto epoch = m_state.epoch();
    if (epoch != m_feed_epoch ||
        m_eot_mark.load(std::memory_order_acquire) == mark(epoch) ||
        m_failed_mark.load(std::memory_order_acquire) == mark(epoch)) {
        return false;
    }

    const auto index = m_pool.acquire_free();
    if (!index) {
        return false;
    }
    auto& buf = m_pool[*index];

    std::size_t frames = 0;
    try {
        frames = m_feed->read_frames(buf, m_frames_per_buffer);
    } catch (const decoder_error& e) {
        buf.state.store(buffer_state::free, std::memory_order_release);
        m_failed_mark.store(mark(epoch), std::memory_order_release);
        LOG_ERROR("buffer_queue", "Decode failed: ", e.what());
        if (m_sink) {
            m_sink(command::track_failed(epoch, e.what()));
        }
        return false;
    }

    // Checkpoint: a flush during the read makes this fill worthless
    if (m_state.epoch() != epoch) {
        buf.state.store(buffer_state::free, std::memory_order_release);
        LOG_DEBUG("buffer_queue", "Abandoned fill for epoch ", epoch);
        return false;
    }

    if (frames == 0) {
        buf.state.store(buffer_state::free, std::memory_order_release);
        m_eot_mark.store(mark(epoch), std::memory_order_release);
        LOG_DEBUG("buffer_queue", "End of track after ", m_feed->frames_read(), " frames");
        return false;
    }

    buf.epoch.store(epoch, std::memory_order_relaxed);
    buf.sequence.store(m_next_sequence++, std::memory_order_relaxed);
    buf.state.store(buffer_state::filled, std::memory_order_release);

    // A short final read already tells us the track is over
    if (m_feed->at_end()) {
        m_eot_mark.store(mark(epoch), std::memory_order_release);
        LOG_DEBUG("buffer_queue", "End of track after ", m_feed->frames_read(), " frames");
    }
    return true;
}

void buffer_queue::service() {
    if (m_complete_pending.exchange(false, std::memory_order_acq_rel)) {
        const auto completed = m_complete_mark.load(std::memory_order_acquire) - 1;
        LOG_DEBUG("buffer_queue", "Track complete for epoch ", completed);
        if (m_sink) {
            m_sink(command::track_finished(completed));
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_feed_mutex);
        const auto total = m_underruns.load(std::memory_order_relaxed);
        if (total > m_reported_underruns) {
            LOG_WARN("buffer_queue", "Underrun: ", total - m_reported_underruns,
                     " render period(s) filled with silence, ", total, " total");
            m_reported_underruns = total;
        }
    }

    refill();
}

const sample_buffer* buffer_queue::silence_buffer() const noexcept {
    return &m_silence;
}

audio_spec buffer_queue::stream_spec() const {
    std::lock_guard<std::mutex> lock(m_feed_mutex);
    return audio_spec{audio_format::f32le, m_channels.load(std::memory_order_acquire), m_rate};
}

std::size_t buffer_queue::frames_per_buffer() const {
    std::lock_guard<std::mutex> lock(m_feed_mutex);
    return m_frames_per_buffer;
}

uint64_t buffer_queue::underruns() const noexcept {
    return m_underruns.load(std::memory_order_relaxed);
}

uint64_t buffer_queue::stale_drops() const noexcept {
    return m_stale_drops.load(std::memory_order_relaxed);
}

uint64_t buffer_queue::frames_played() const noexcept {
    return m_frames_played.load(std::memory_order_relaxed);
}

bool buffer_queue::end_of_track() const noexcept {
    return m_eot_mark.load(std::memory_order_acquire) == mark(m_state.epoch());
}

bool buffer_queue::track_complete() const noexcept {
    return m_complete_mark.load(std::memory_order_acquire) == mark(m_state.epoch());
}

const buffer_pool& buffer_queue::pool() const noexcept {
    return m_pool;
}

} // namespace afqueue
