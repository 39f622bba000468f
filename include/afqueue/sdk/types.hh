/**
 * @file types.hh
 * @brief Sample and format type definitions shared by decoders, the engine and backends
 * @ingroup sdk
 */

#ifndef AFQUEUE_SDK_TYPES_HH
#define AFQUEUE_SDK_TYPES_HH

#include <cstdint>
#include <cstddef>
#include <iosfwd>

namespace afqueue {

    /// Sample rate in Hz (44100, 48000, ...)
    using sample_rate_t = uint32_t;

    /// Number of interleaved channels in a frame
    using channels_t = uint8_t;

    /// Monotonic playback segment counter; see buffer_queue
    using epoch_t = uint64_t;

    /**
     * @brief Sample encoding delivered to an output device
     *
     * The value encodes the bit size in the low byte, float in bit 8,
     * big-endian in bit 12 and signedness in bit 15.
     */
    enum class audio_format : uint16_t {
        unknown = 0,
        s16le = 0x8010,
        s32le = 0x8020,
        f32le = 0x8120,
        f32be = 0x9120
    };

    inline constexpr uint8_t audio_format_bit_size(audio_format fmt) {
        return static_cast<uint8_t>(static_cast<uint16_t>(fmt) & 0xFF);
    }

    inline constexpr uint8_t audio_format_byte_size(audio_format fmt) {
        return audio_format_bit_size(fmt) / 8;
    }

    inline constexpr bool audio_format_is_float(audio_format fmt) {
        return (static_cast<uint16_t>(fmt) & 0x0100) != 0;
    }

    /**
     * @brief Format of an audio stream or device
     */
    struct audio_spec {
        audio_format format = audio_format::f32le;
        channels_t channels = 2;
        sample_rate_t freq = 44100;
    };

    std::ostream& operator<<(std::ostream& os, audio_format fmt);
    std::ostream& operator<<(std::ostream& os, const audio_spec& spec);

} // namespace afqueue

#endif // AFQUEUE_SDK_TYPES_HH
