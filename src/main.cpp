#include "Utils/Exception.hpp"
#include "Utils/Logger.hpp"
#include "Virtualization/catalog/DeviceCatalogGenerator.hpp"
#include "Virtualization/vmm/QemuConfig.hpp"
#include <getopt.h>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifndef QEMUKIT_VERSION
#define QEMUKIT_VERSION "unknown"
#endif

using namespace QEMUKIT;

namespace {

constexpr int kExitRuntimeError = 1;
constexpr int kExitUsage = 2;

struct Switches {
    bool argv = false;
    std::optional<std::string> config;
    std::optional<std::string> qemu;
    std::optional<std::string> output;
    std::optional<CatalogFormat> format;
    std::optional<std::chrono::seconds> timeout;
    std::optional<BoostLogger::Level> logLevel;
    std::optional<std::string> logFile;
    std::vector<std::string> positional;
};

const option kLongOptions[] = {
    { "argv",      no_argument,       nullptr, 'a' },
    { "config",    required_argument, nullptr, 'c' },
    { "qemu",      required_argument, nullptr, 'q' },
    { "output",    required_argument, nullptr, 'o' },
    { "format",    required_argument, nullptr, 'f' },
    { "timeout",   required_argument, nullptr, 't' },
    { "log-level", required_argument, nullptr, 'l' },
    { "log-file",  required_argument, nullptr, 'L' },
    { "help",      no_argument,       nullptr, 'h' },
    { "version",   no_argument,       nullptr, 'V' },
    { nullptr, 0, nullptr, 0 }
};

[[noreturn]] void usage(int status) {
    std::ostream& out = status == 0 ? std::cout : std::cerr;
    out << "qemukit - render QEMU command lines and catalog QEMU devices\n"
           "Usage:\n"
           "  qemukit cmdline [--argv] CONFIG.json\n"
           "  qemukit devices [--config CONFIG.json] [--qemu PATH] [--output FILE]\n"
           "                  [--format text|xml] [--timeout SECONDS]\n"
           "Options:\n"
           "  -a, --argv             print one argument per line\n"
           "  -c, --config FILE      JSON configuration\n"
           "  -q, --qemu PATH        qemu-system binary to query\n"
           "  -o, --output FILE      catalog file to write\n"
           "  -f, --format FORMAT    catalog format, text (default) or xml\n"
           "  -t, --timeout SECONDS  give up on the qemu run after SECONDS\n"
           "  -l, --log-level LEVEL  trace, debug, info, warning, error, fatal\n"
           "  -L, --log-file FILE    also log to FILE\n"
           "  -h, --help             display this help and exit\n"
           "  -V, --version          output version information and exit\n";
    std::exit(status);
}

[[noreturn]] void badUsage(const std::string& msg) {
    std::cerr << "qemukit: " << msg << '\n';
    usage(kExitUsage);
}

Switches decodeSwitches(int argc, char** argv) {
    Switches sw;
    optind = 1;
    int c;
    while ((c = getopt_long(argc, argv, "ac:q:o:f:t:l:L:hV", kLongOptions, nullptr)) != -1) {
        switch (c) {
            case 'a': sw.argv = true; break;
            case 'c': sw.config = optarg; break;
            case 'q': sw.qemu = optarg; break;
            case 'o': sw.output = optarg; break;
            case 'f':
                sw.format = catalogFormatFromString(optarg);
                if (!sw.format) badUsage(std::string("unknown format '") + optarg + "'");
                break;
            case 't': {
                const std::string_view text(optarg);
                long long seconds = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
                if (ec != std::errc() || ptr != text.data() + text.size() || seconds <= 0) {
                    badUsage(std::string("invalid timeout '") + optarg + "'");
                }
                sw.timeout = std::chrono::seconds(seconds);
                break;
            }
            case 'l':
                sw.logLevel = BoostLogger::ParseLevel(optarg);
                if (!sw.logLevel) badUsage(std::string("unknown log level '") + optarg + "'");
                break;
            case 'L': sw.logFile = optarg; break;
            case 'h': usage(0);
            case 'V':
                std::cout << "qemukit " << QEMUKIT_VERSION << '\n';
                std::exit(0);
            default:
                usage(kExitUsage);
        }
    }
    for (int i = optind; i < argc; ++i) {
        sw.positional.emplace_back(argv[i]);
    }
    return sw;
}

void initLogging(const Switches& sw, const std::optional<QemuConfig>& cfg) {
    BoostLogger::Config config = cfg ? cfg->loggerConfig() : BoostLogger::Config{};
    if (sw.logLevel) config.console_level = *sw.logLevel;
    if (sw.logFile) {
        config.enable_file = true;
        config.file_path = *sw.logFile;
    }
    BoostLogger::Init(config);
}

std::optional<QemuConfig> loadConfig(const std::string& path) {
    auto cfg = QemuConfig::fromFile(path);
    if (!cfg) {
        std::cerr << "qemukit: " << cfg.error() << '\n';
        return std::nullopt;
    }
    return std::move(*cfg);
}

int runCmdline(const Switches& sw) {
    if (sw.positional.size() != 1) badUsage("cmdline expects exactly one configuration file");
    auto cfg = loadConfig(sw.positional.front());
    if (!cfg) return kExitRuntimeError;
    initLogging(sw, cfg);

    const QemuOptions options = cfg->toOptions();
    if (sw.argv) {
        for (const auto& arg : options.toArguments()) {
            std::cout << arg << '\n';
        }
    } else {
        std::cout << options.toCommandLine() << '\n';
    }
    return 0;
}

int runDevices(const Switches& sw) {
    if (!sw.positional.empty()) badUsage("devices takes no positional arguments");
    std::optional<QemuConfig> cfg;
    if (sw.config) {
        cfg = loadConfig(*sw.config);
        if (!cfg) return kExitRuntimeError;
    }
    initLogging(sw, cfg);

    const CatalogConfig defaults = cfg ? cfg->catalog : CatalogConfig{};
    const std::string qemu = sw.qemu ? *sw.qemu : (cfg ? cfg->qemu : std::string(QemuOptions::kDefaultQemuBinary));
    const std::string output = sw.output ? *sw.output : defaults.output;
    const CatalogFormat format = sw.format ? *sw.format : defaults.format;
    const auto timeout = sw.timeout ? sw.timeout : defaults.timeout;

    std::optional<std::chrono::milliseconds> bound;
    if (timeout) bound = std::chrono::duration_cast<std::chrono::milliseconds>(*timeout);

    DeviceCatalogGenerator generator(qemu, nullptr, bound);
    generator.generateDevicesFile(output, format);
    std::cout << output << '\n';
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) usage(kExitUsage);
    const std::string command = argv[1];
    if (command == "-h" || command == "--help") usage(0);
    if (command == "-V" || command == "--version") {
        std::cout << "qemukit " << QEMUKIT_VERSION << '\n';
        return 0;
    }

    // getopt sees the subcommand as argv[0]
    const Switches sw = decodeSwitches(argc - 1, argv + 1);

    try {
        if (command == "cmdline") return runCmdline(sw);
        if (command == "devices") return runDevices(sw);
    } catch (const QemuKitException& e) {
        std::cerr << "qemukit: " << e.what() << '\n';
        return kExitRuntimeError;
    } catch (const std::exception& e) {
        std::cerr << "qemukit: " << e.what() << '\n';
        return kExitRuntimeError;
    }
    badUsage("unknown command '" + command + "'");
}
