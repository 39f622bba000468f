#include <afqueue_backends/sdl3/sdl3_backend.hh>
#include "sdl3_backend_impl.hh"

namespace afqueue {

std::unique_ptr<audio_backend> create_sdl3_backend() {
    return std::make_unique<sdl3_backend>();
}

} // namespace afqueue
