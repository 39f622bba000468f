/**
 * @file buffer.hh
 * @brief Fixed size storage block for decoded samples
 * @ingroup sdk
 */

#pragma once

#include <algorithm>
#include <memory>
#include <type_traits>
#include <stdexcept>

namespace afqueue {
    /**
     * @class buffer
     * @brief RAII block of trivially copyable elements with a fixed size
     * @tparam T Element type (must be trivially copyable)
     * @ingroup sdk
     *
     * Unlike std::vector the size is chosen once at construction and never
     * changes, so a buffer owned by the render path can never reallocate
     * behind its back. All elements start zeroed.
     *
     * @code
     * buffer<float> block(4096);
     * std::fill(block.begin(), block.end(), 0.5f);
     * consume(block.data(), block.size());
     * @endcode
     */
    template<typename T>
    class buffer final {
        static_assert(std::is_trivially_copyable_v<T>, "buffer<T> requires trivially copyable T");
    public:
        explicit buffer(std::size_t size)
            : m_data(std::make_unique<T[]>(size)), m_size(size) {
            std::fill_n(m_data.get(), m_size, T{});
        }

        buffer(buffer&&) noexcept = default;
        buffer& operator=(buffer&&) noexcept = default;

        [[nodiscard]] std::size_t size() const noexcept {
            return m_size;
        }

        T* data() noexcept { return m_data.get(); }
        const T* data() const noexcept { return m_data.get(); }

        /**
         * @brief Bounds-checked element access
         * @throws std::out_of_range if pos >= size()
         */
        T& at(std::size_t pos) {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        const T& at(std::size_t pos) const {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        /**
         * @brief Zero the first @p count elements (all when count exceeds size)
         */
        void clear(std::size_t count) noexcept {
            std::fill_n(m_data.get(), std::min(count, m_size), T{});
        }

        T& operator[](std::size_t pos) noexcept { return m_data[pos]; }
        const T& operator[](std::size_t pos) const noexcept { return m_data[pos]; }

        T* begin() noexcept { return data(); }
        T* end() noexcept { return data() + size(); }
        const T* begin() const noexcept { return data(); }
        const T* end() const noexcept { return data() + size(); }

    private:
        std::unique_ptr<T[]> m_data;
        std::size_t m_size;
    };
}
