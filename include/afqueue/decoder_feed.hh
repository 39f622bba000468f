#ifndef AFQUEUE_DECODER_FEED_HH
#define AFQUEUE_DECODER_FEED_HH

#include <afqueue/sdk/io_stream.hh>
#include <afqueue/sdk/types.hh>
#include <chrono>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace afqueue {

    class decoder;
    class decoders_registry;
    struct sample_buffer;

    /**
     * @brief Format of an opened track
     */
    struct format_info {
        sample_rate_t sample_rate = 0;
        channels_t channels = 0;
        /// Bit depth of the samples handed out (always 32-bit float)
        unsigned bits_per_sample = 32;
        /// Estimated duration, zero when the container does not tell
        std::chrono::microseconds duration{0};
        std::string decoder_name;
        /// Text tags of the file, empty when it carries none
        std::vector<std::pair<std::string, std::string>> tags;
    };

    std::ostream& operator<<(std::ostream& os, const format_info& info);

    /**
     * @class decoder_feed
     * @brief Pulls frames from one track's decoder into pool buffers
     *
     * Owns the byte stream and the decoder of the track it opened. Byte
     * streams come from a stream opener, io_from_file() unless the caller
     * supplies another one.
     *
     * Not thread-safe; the buffer queue serialises every call.
     */
    class decoder_feed {
        public:
            using stream_opener_t = std::function<std::unique_ptr<io_stream>(const std::string&)>;

            explicit decoder_feed(const decoders_registry& registry,
                                  stream_opener_t opener = stream_opener_t());
            ~decoder_feed();

            decoder_feed(const decoder_feed&) = delete;
            decoder_feed& operator=(const decoder_feed&) = delete;

            /**
             * @brief Open @p path and set up a decoder for it
             * @throws io_error if the file is missing or unreadable
             * @throws decoder_error if no decoder accepts the data or the decoder fails to start
             */
            format_info open(const std::string& path);

            /**
             * @brief Decode up to @p max_frames frames into @p buf
             *
             * Sets the buffer's length and frames. Reads are clipped to the
             * buffer capacity.
             *
             * @return Frames read, 0 at the end of the track
             * @throws decoder_error on corrupt data
             */
            std::size_t read_frames(sample_buffer& buf, std::size_t max_frames);

            /**
             * @brief Release the decoder and the stream
             */
            void close();

            [[nodiscard]] bool is_open() const;
            /// True once the decoder reported the end of its data
            [[nodiscard]] bool at_end() const;
            [[nodiscard]] const std::string& path() const;
            [[nodiscard]] const format_info& format() const;
            [[nodiscard]] uint64_t frames_read() const;

        private:
            const decoders_registry& m_registry;
            stream_opener_t m_opener;
            std::unique_ptr<io_stream> m_stream;
            std::unique_ptr<decoder> m_decoder;
            std::string m_path;
            format_info m_format;
            uint64_t m_frames_read = 0;
            bool m_at_end = false;
    };

} // namespace afqueue

#endif
