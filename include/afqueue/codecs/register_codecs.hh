#pragma once

#include <memory>

namespace afqueue {
    class decoders_registry;

    /**
     * @brief Register every built-in decoder with the given registry
     *
     * Priorities: WAV 100, MP3 90, FLAC 80, Ogg Vorbis 70.
     */
    void register_all_codecs(decoders_registry& registry);

    /**
     * @brief Convenience helper returning a registry with all built-in decoders
     */
    std::unique_ptr <decoders_registry> create_registry_with_all_codecs();
} // namespace afqueue
