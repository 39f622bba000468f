/**
 * @file decoder.hh
 * @brief Base class for audio format decoders
 * @ingroup sdk
 */

#pragma once

#include <afqueue/sdk/io_stream.hh>
#include <afqueue/sdk/types.hh>
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace afqueue {
    /**
     * @class decoder
     * @brief Abstract base class for all audio format decoders
     * @ingroup sdk
     *
     * A decoder turns an encoded byte stream into interleaved float PCM in
     * the range [-1.0, 1.0], in the file's own channel layout and sample
     * rate. Conversion to the device format is left to the output backend.
     *
     * ## Decoder Lifecycle
     *
     * 1. Construction
     * 2. open() - parse the header from an io_stream
     * 3. get_channels()/get_rate()/duration() - query the format
     * 4. decode() - called repeatedly until it returns 0
     * 5. Destruction
     *
     * Each concrete decoder also provides a static `accept(io_stream*)` used
     * by decoders_registry for format detection.
     *
     * @see io_stream, decoders_registry
     */
    class decoder {
        public:
            /// Tag name and value pairs in file order, names lowercased
            using metadata_t = std::vector <std::pair <std::string, std::string>>;

            decoder();
            virtual ~decoder();

            /**
             * @brief Check if decoder is open and ready
             */
            [[nodiscard]] bool is_open() const;

            /**
             * @brief Decode audio data to float samples
             *
             * @param[out] buf Buffer to fill with interleaved samples
             * @param len Buffer size in samples (not frames)
             * @param[out] call_again Set to false once the end of the data is reached
             * @return Number of samples written; 0 means end of stream
             * @throws decoder_error if the data is corrupt
             */
            [[nodiscard]] size_t decode(float buf[], size_t len, bool& call_again);

            /**
             * @brief Human-readable name of this decoder
             */
            [[nodiscard]] virtual const char* get_name() const = 0;

            /**
             * @brief Parse the header and prepare for decoding
             * @param rwops I/O stream with encoded data, not owned
             * @throws decoder_error if the format is invalid or unsupported
             */
            virtual void open(io_stream* rwops) = 0;

            [[nodiscard]] virtual channels_t get_channels() const = 0;

            [[nodiscard]] virtual sample_rate_t get_rate() const = 0;

            /**
             * @brief Total duration, zero if unknown
             */
            [[nodiscard]] virtual std::chrono::microseconds duration() const = 0;

            /**
             * @brief Text tags found while opening (title, artist, ...)
             *
             * Empty unless the decoder reads a tag block. Valid after open().
             */
            [[nodiscard]] virtual metadata_t get_metadata() const;

        protected:
            /**
             * @brief Call from open() after successful initialization
             */
            void set_is_open(bool f);

            virtual size_t do_decode(float* buf, size_t len, bool& call_again) = 0;

        private:
            struct impl;
            const std::unique_ptr <impl> m_pimpl;
    };
} // namespace afqueue
