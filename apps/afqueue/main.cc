#include <afqueue/cli.hh>
#include <afqueue/backends/null/null_backend.hh>
#include <afqueue/sdk/audio_backend.hh>
#include <afqueue_backends/sdl3/sdl3_backend.hh>

#include <iostream>

int main(int argc, char* argv[]) {
    return afqueue::run_app(argc, argv, std::cout, std::cerr,
        [](const afqueue::player_config& config) -> std::shared_ptr<afqueue::audio_backend> {
            if (config.use_null_backend) {
                return afqueue::create_null_backend();
            }
            return afqueue::create_sdl3_backend();
        });
}
