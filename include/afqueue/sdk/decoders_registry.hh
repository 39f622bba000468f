/**
 * @file decoders_registry.hh
 * @brief Audio decoder registry and format detection
 * @ingroup sdk
 */

#pragma once

#include <afqueue/sdk/io_stream.hh>
#include <functional>
#include <memory>
#include <vector>

namespace afqueue {

    class decoder;

    /**
     * @class decoders_registry
     * @brief Prioritised list of decoders with format detection
     * @ingroup sdk
     *
     * Each entry pairs an accept() check with a factory. find_decoder()
     * tries the entries in priority order (highest first) and returns a
     * fresh, unopened decoder from the first one that accepts the stream.
     * The stream position is restored before and after every check.
     *
     * @code
     * decoders_registry registry;
     * register_all_codecs(registry);
     *
     * auto stream = io_from_file("music.flac");
     * if (auto dec = registry.find_decoder(stream.get())) {
     *     dec->open(stream.get());
     * }
     * @endcode
     *
     * Registration is not thread-safe; configure once at startup.
     */
    class decoders_registry {
    public:
        using accept_func_t = std::function<bool(io_stream*)>;
        using factory_func_t = std::function<std::unique_ptr<decoder>()>;

        /**
         * @brief Register a decoder
         * @param priority Higher values are tried first; equal priorities keep
         *                 registration order
         */
        void register_decoder(accept_func_t accept,
                              factory_func_t factory,
                              int priority = 0);

        /**
         * @brief Find a decoder for the given stream
         * @return Unopened decoder, or nullptr when no entry accepts the data
         */
        [[nodiscard]] std::unique_ptr<decoder> find_decoder(io_stream* stream) const;

        [[nodiscard]] bool can_decode(io_stream* stream) const;

        [[nodiscard]] size_t size() const;

        void clear();

    private:
        struct decoder_entry {
            accept_func_t accept;
            factory_func_t factory;
            int priority;
        };

        [[nodiscard]] const decoder_entry* match(io_stream* stream) const;

        std::vector<decoder_entry> m_decoders;
    };

} // namespace afqueue
