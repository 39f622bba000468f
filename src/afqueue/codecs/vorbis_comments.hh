#ifndef AFQUEUE_CODECS_VORBIS_COMMENTS_HH
#define AFQUEUE_CODECS_VORBIS_COMMENTS_HH

#include <afqueue/sdk/decoder.hh>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

// FLAC and Ogg Vorbis share the "NAME=value" comment layout
namespace afqueue::codecs {
    inline void add_vorbis_comment(decoder::metadata_t& out, const char* text, size_t len) {
        if (!text) {
            return;
        }
        const std::string comment(text, len);
        const auto eq = comment.find('=');
        if (eq == std::string::npos || eq == 0) {
            return;
        }
        std::string name = comment.substr(0, eq);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast <char>(std::tolower(c)); });
        out.emplace_back(std::move(name), comment.substr(eq + 1));
    }
} // namespace afqueue::codecs

#endif
