#ifndef AFQUEUE_CLI_HH
#define AFQUEUE_CLI_HH

#include <afqueue/config.hh>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace afqueue {

    class audio_backend;

    struct cli_options {
        std::vector<std::string> files;
        player_config config;
        bool show_help = false;
    };

    /**
     * @brief Parse the arguments after the program name
     *
     * Options may appear anywhere; "--" ends option parsing. Files are kept
     * in the order given.
     *
     * @throws config_error on an unknown option, a missing or malformed
     *         value, or a value out of range
     */
    cli_options parse_cli(const std::vector<std::string>& args);

    std::string usage(const std::string& exec);

    using backend_factory_t = std::function<std::shared_ptr<audio_backend>(const player_config&)>;

    /**
     * @brief Whole program: parse, set up the terminal, play, tear down
     *
     * Without any file the usage is written to @p err and 1 is returned
     * before any backend is created.
     *
     * @return Process exit code
     */
    int run_app(int argc, const char* const argv[],
                std::ostream& out, std::ostream& err,
                const backend_factory_t& make_backend);

} // namespace afqueue

#endif
