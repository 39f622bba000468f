#include <afqueue/sdk/decoders_registry.hh>
#include <afqueue/sdk/decoder.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <stdexcept>

namespace afqueue {

void decoders_registry::register_decoder(accept_func_t accept,
                                         factory_func_t factory,
                                         int priority) {
    m_decoders.push_back({std::move(accept), std::move(factory), priority});

    std::stable_sort(m_decoders.begin(), m_decoders.end(),
                     [](const decoder_entry& a, const decoder_entry& b) {
                         return a.priority > b.priority;
                     });
}

const decoders_registry::decoder_entry* decoders_registry::match(io_stream* stream) const {
    if (!stream || !stream->is_open()) {
        return nullptr;
    }

    const auto original_pos = stream->tell();
    if (original_pos < 0) {
        return nullptr;
    }

    const decoder_entry* found = nullptr;
    for (const auto& entry : m_decoders) {
        stream->seek(original_pos, seek_origin::set);

        bool accepted = false;
        try {
            accepted = entry.accept && entry.accept(stream);
        } catch (const std::exception& e) {
            LOG_DEBUG("decoders_registry", "Format check failed: ", e.what());
        }
        if (accepted && entry.factory) {
            found = &entry;
            break;
        }
    }

    stream->seek(original_pos, seek_origin::set);
    return found;
}

std::unique_ptr<decoder> decoders_registry::find_decoder(io_stream* stream) const {
    const auto* entry = match(stream);
    if (!entry) {
        return nullptr;
    }
    return entry->factory();
}

bool decoders_registry::can_decode(io_stream* stream) const {
    return match(stream) != nullptr;
}

size_t decoders_registry::size() const {
    return m_decoders.size();
}

void decoders_registry::clear() {
    m_decoders.clear();
}

} // namespace afqueue
