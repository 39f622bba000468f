#include <afqueue/sdk/types.hh>
#include <ostream>

namespace afqueue {
    std::ostream& operator<<(std::ostream& os, audio_format fmt) {
        switch (fmt) {
            case audio_format::s16le: return os << "s16le";
            case audio_format::s32le: return os << "s32le";
            case audio_format::f32le: return os << "f32le";
            case audio_format::f32be: return os << "f32be";
            default: return os << "unknown";
        }
    }

    std::ostream& operator<<(std::ostream& os, const audio_spec& spec) {
        os << "audio_spec{"
           << "format=" << spec.format << ", "
           << "channels=" << static_cast<int>(spec.channels) << ", "
           << "freq=" << spec.freq
           << "}";
        return os;
    }
}
