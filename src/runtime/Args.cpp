#include "runtime/Args.hpp"
#include "config/Config.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace mcs::runtime {

namespace {

ArgsParse invalid(std::string msg) {
    ArgsParse p;
    p.error = std::move(msg);
    return p;
}

}

ArgsParse parseArgs(const std::vector<std::string>& argv) {
    ArgsParse out;

    for (size_t i = 0; i < argv.size(); ++i) {
        std::string key = argv[i];
        std::optional<std::string> inlineValue;

        if (key.starts_with("--")) {
            if (const auto eq = key.find('='); eq != std::string::npos) {
                inlineValue = key.substr(eq + 1);
                key = key.substr(0, eq);
            }
        }

        const auto value = [&]() -> std::optional<std::string> {
            if (inlineValue) return inlineValue;
            if (i + 1 >= argv.size() || argv[i + 1].starts_with("-")) return std::nullopt;
            return argv[++i];
        };

        if (key == "-h" || key == "--help") out.args.help = true;
        else if (key == "-v" || key == "--version") out.args.version = true;
        else if (key == "-b" || key == "--basic") out.args.basic = true;
        else if (key == "-f" || key == "--ftp_host") {
            const auto v = value();
            if (!v || v->empty()) return invalid(fmt::format("{} requires a host", key));
            out.args.ftpHost = *v;
        } else if (key == "-l" || key == "--local") {
            const auto v = value();
            if (!v || v->empty()) return invalid(fmt::format("{} requires a directory", key));
            out.args.local = *v;
        } else if (key == "-c" || key == "--config") {
            const auto v = value();
            if (!v || v->empty()) return invalid(fmt::format("{} requires a file", key));
            out.args.config = *v;
        } else if (key == "-t" || key == "--targets") {
            const auto v = value();
            if (!v || v->empty()) return invalid(fmt::format("{} requires a file", key));
            out.args.targets = *v;
        } else return invalid(fmt::format("Unknown argument: {}", argv[i]));
    }

    out.ok = true;
    return out;
}

std::string usage(const std::string& prog) {
    return fmt::format(
        "usage: {} -f FTP_HOST [-l LOCAL] [-c CONFIG] [-t TARGETS] [-b] [-v] [-h]\n"
        "\n"
        "Syncs PS2 memory card images between a MemCard PRO 2 and PC.\n"
        "\n"
        "  -f, --ftp_host HOST   address of the FTP server\n"
        "  -l, --local DIR       local directory to sync card images to/from (default: .)\n"
        "  -c, --config FILE     YAML configuration file\n"
        "  -t, --targets FILE    JSON list of cards to sync (default: targets.json)\n"
        "  -b, --basic           plain output without progress bars\n"
        "  -v, --version         print version and exit\n"
        "  -h, --help            show this help\n"
        "\n"
        "Credentials are read from the MCP2_USER and MCP2_PWD environment variables.\n",
        prog);
}

void applyArgs(const Args& args, config::Config& cfg) {
    if (args.ftpHost) cfg.ftp.host = *args.ftpHost;
    if (args.local) cfg.sync.local_root = *args.local;
    if (args.targets) cfg.sync.targets_file = *args.targets;
    if (args.basic) cfg.sync.basic_output = true;

    if (cfg.ftp.host.empty()) throw std::invalid_argument("An FTP host is required (-f/--ftp_host)");
}

}
