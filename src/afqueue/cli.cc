#include <afqueue/cli.hh>
#include <afqueue/command_channel.hh>
#include <afqueue/codecs/register_codecs.hh>
#include <afqueue/error.hh>
#include <afqueue/input_loop.hh>
#include <afqueue/player.hh>
#include <afqueue/raw_terminal.hh>
#include <afqueue/sdk/decoders_registry.hh>
#include <afqueue/status_display.hh>
#include <failsafe/failsafe.hh>

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <ostream>
#include <unistd.h>

namespace afqueue {

namespace {
    long parse_number(const std::string& option, const std::string& value) {
        char* end = nullptr;
        errno = 0;
        const long v = std::strtol(value.c_str(), &end, 10);
        if (value.empty() || !end || *end != '\0' || errno == ERANGE) {
            throw config_error(option + " expects a number, got '" + value + "'");
        }
        return v;
    }
}

cli_options parse_cli(const std::vector<std::string>& args) {
    cli_options opts;
    bool options_done = false;

    for (std::size_t i = 0; i < args.size(); i++) {
        const auto& a = args[i];
        if (options_done || a.empty() || a[0] != '-' || a == "-") {
            opts.files.push_back(a);
            continue;
        }

        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw config_error(a + " requires a value");
            }
            return args[++i];
        };

        if (a == "--") {
            options_done = true;
        } else if (a == "-h" || a == "--help") {
            opts.show_help = true;
        } else if (a == "--buffers") {
            const auto n = parse_number(a, value());
            if (n < static_cast<long>(MIN_BUFFER_COUNT) || n > static_cast<long>(MAX_BUFFER_COUNT)) {
                throw config_error("--buffers must be between " + std::to_string(MIN_BUFFER_COUNT) +
                                   " and " + std::to_string(MAX_BUFFER_COUNT));
            }
            opts.config.buffer_count = static_cast<std::size_t>(n);
        } else if (a == "--buffer-ms") {
            const auto ms = parse_number(a, value());
            if (ms < MIN_BUFFER_MS || ms > MAX_BUFFER_MS) {
                throw config_error("--buffer-ms must be between " + std::to_string(MIN_BUFFER_MS) +
                                   " and " + std::to_string(MAX_BUFFER_MS));
            }
            opts.config.buffer_duration = std::chrono::milliseconds(ms);
        } else if (a == "--device") {
            opts.config.device_id = value();
        } else if (a == "--null-audio") {
            opts.config.use_null_backend = true;
        } else {
            throw config_error("Unknown option: " + a);
        }
    }

    opts.config.validate();
    return opts;
}

std::string usage(const std::string& exec) {
    return "Usage: " + exec + " [options] <audio-file> [<audio-file> ...]\n"
           "Options:\n"
           "  -h, --help         Show this help\n"
           "  --buffers <n>      Number of playback buffers (" + std::to_string(MIN_BUFFER_COUNT) +
           "-" + std::to_string(MAX_BUFFER_COUNT) + ", default " +
           std::to_string(AFQUEUE_DEFAULT_BUFFER_COUNT) + ")\n"
           "  --buffer-ms <ms>   Playback time per buffer (" + std::to_string(MIN_BUFFER_MS) +
           "-" + std::to_string(MAX_BUFFER_MS) + ", default " +
           std::to_string(AFQUEUE_DEFAULT_BUFFER_MS) + ")\n"
           "  --device <id>      Output device id or name\n"
           "  --null-audio       Play into a silent clock instead of a sound card\n"
           "Keys: n next, p pause, [ quieter, ] louder, q quit\n";
}

int run_app(int argc, const char* const argv[],
            std::ostream& out, std::ostream& err,
            const backend_factory_t& make_backend) {
    const std::string exec = argc > 0 && argv[0] ? argv[0] : "afqueue";
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.emplace_back(argv[i]);
    }

    cli_options opts;
    try {
        opts = parse_cli(args);
    } catch (const config_error& e) {
        err << e.what() << "\n" << usage(exec);
        return 1;
    }
    if (opts.show_help) {
        out << usage(exec);
        return 0;
    }
    if (opts.files.empty()) {
        err << usage(exec);
        return 1;
    }

    std::shared_ptr<audio_backend> backend;
    try {
        backend = make_backend(opts.config);
    } catch (const std::exception& e) {
        err << "Cannot create audio backend: " << e.what() << "\n";
        return 1;
    }
    if (!backend) {
        err << "No audio backend available\n";
        return 1;
    }

    decoders_registry registry;
    register_all_codecs(registry);

    command_channel channel;
    const bool interactive = raw_terminal::is_terminal(STDIN_FILENO) && raw_terminal::is_terminal(STDOUT_FILENO);
    std::optional<resize_watch> winch;
    status_display display(out, interactive);
    display.set_width(resize_watch::columns(STDOUT_FILENO).value_or(80));
    display.set_width_source([&winch]() -> std::optional<std::size_t> {
        if (!winch || !winch->take()) {
            return std::nullopt;
        }
        return resize_watch::columns(STDOUT_FILENO);
    });

    int rc = 1;
    try {
        std::optional<raw_terminal> terminal;
        if (interactive) {
            terminal.emplace(STDIN_FILENO, STDOUT_FILENO);
            winch.emplace();
        }

        player p(opts.config, opts.files, backend, registry, channel, &display);
        input_loop keys(STDIN_FILENO, channel);
        keys.start();
        rc = p.run();
        keys.stop();
        channel.close();
    } catch (const device_error& e) {
        LOG_ERROR("main", e.what());
        err << "Device error: " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        LOG_ERROR("main", e.what());
        err << "Error: " << e.what() << "\n";
        rc = 1;
    }
    return rc;
}

} // namespace afqueue
