/**
 * @file io_stream.hh
 * @brief Byte stream abstraction used by decoders
 * @ingroup sdk
 */

#ifndef AFQUEUE_SDK_IO_STREAM_HH
#define AFQUEUE_SDK_IO_STREAM_HH

#include <afqueue/sdk/types.hh>
#include <memory>
#include <string>

namespace afqueue {

    enum class seek_origin : int {
        set = 0, ///< From beginning of stream (SEEK_SET)
        cur = 1, ///< From current position (SEEK_CUR)
        end = 2  ///< From end of stream (SEEK_END)
    };

    /**
     * @class io_stream
     * @brief Read-only random access byte source
     * @ingroup sdk
     *
     * Decoders never open files themselves; they receive an io_stream so the
     * same decoder works for files on disk and for in-memory data.
     * Failing operations return 0 (read) or -1 (seek, tell, get_size).
     */
    class io_stream {
    public:
        virtual ~io_stream() = default;

        /**
         * @brief Read up to @p size_bytes bytes into @p ptr
         * @return Number of bytes read, 0 on end of stream or error
         */
        virtual size_t read(void* ptr, size_t size_bytes) = 0;

        /**
         * @brief Reposition the stream
         * @return New absolute position, or -1 on error
         */
        virtual int64_t seek(int64_t offset, seek_origin whence) = 0;

        virtual int64_t tell() = 0;

        virtual int64_t get_size() = 0;

        virtual void close() = 0;

        [[nodiscard]] virtual bool is_open() const = 0;
    };

    /**
     * @brief Open a file for reading
     *
     * Never throws; when the file is missing or unreadable the returned
     * stream reports is_open() == false.
     */
    std::unique_ptr<io_stream> io_from_file(const std::string& filename);

    /**
     * @brief Wrap a memory region (not owned, must outlive the stream)
     */
    std::unique_ptr<io_stream> io_from_memory(const void* mem, size_t size_bytes);

} // namespace afqueue

#endif // AFQUEUE_SDK_IO_STREAM_HH
