#include <afqueue/codecs/register_codecs.hh>
#include <afqueue/sdk/decoders_registry.hh>

#include <afqueue/codecs/decoder_drwav.hh>
#include <afqueue/codecs/decoder_drmp3.hh>
#include <afqueue/codecs/decoder_drflac.hh>
#include <afqueue/codecs/decoder_vorbis.hh>

namespace afqueue {

void register_all_codecs(decoders_registry& registry) {
    registry.register_decoder(
        decoder_drwav::accept,
        []() { return std::make_unique<decoder_drwav>(); },
        100
    );

    registry.register_decoder(
        decoder_drmp3::accept,
        []() { return std::make_unique<decoder_drmp3>(); },
        90
    );

    registry.register_decoder(
        decoder_drflac::accept,
        []() { return std::make_unique<decoder_drflac>(); },
        80
    );

    registry.register_decoder(
        decoder_vorbis::accept,
        []() { return std::make_unique<decoder_vorbis>(); },
        70
    );
}

std::unique_ptr<decoders_registry> create_registry_with_all_codecs() {
    auto registry = std::make_unique<decoders_registry>();
    register_all_codecs(*registry);
    return registry;
}

} // namespace afqueue
