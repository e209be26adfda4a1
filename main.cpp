#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "progress/Bar.hpp"
#include "runtime/Args.hpp"
#include "runtime/Credentials.hpp"
#include "runtime/TargetList.hpp"
#include "sync/Error.hpp"
#include "sync/Orchestrator.hpp"
#include "sync/mapping/Strategy.hpp"
#include "transport/FtpSession.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <string>
#include <vector>

using namespace mcs;
using namespace mcs::log;

namespace {
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CANCELLED = 130;

std::atomic<bool> shouldExit = false;

void signalHandler(int) { shouldExit = true; }

std::vector<sync::model::Target> buildTargets(const config::Config& cfg) {
    const auto strategy = sync::mapping::create(cfg);
    const auto localRoot = std::filesystem::absolute(cfg.sync.local_root).lexically_normal();

    std::vector<sync::model::Target> targets;
    for (auto& id : runtime::loadTargetList(cfg.sync.targets_file))
        targets.emplace_back(std::move(id), localRoot, *strategy);

    Registry::ps2mcs()->info("[*] {} target(s) resolved with {} naming under {}",
                             targets.size(), strategy->name(), localRoot.string());
    return targets;
}
}

int main(const int argc, char** argv) {
    const auto parsed = runtime::parseArgs(std::vector<std::string>(argv + 1, argv + argc));
    if (!parsed.ok) {
        fmt::print(stderr, "{}\n\n{}", parsed.error, runtime::usage());
        return EXIT_USAGE;
    }

    const auto& args = parsed.args;
    if (args.help) {
        fmt::print("{}", runtime::usage());
        return EXIT_SUCCESS;
    }
    if (args.version) {
        fmt::print("ps2mcs {}\n", runtime::VERSION);
        return EXIT_SUCCESS;
    }

    config::Config cfg;
    try {
        cfg = args.config ? config::loadConfig(*args.config) : config::defaultConfig();
        runtime::applyArgs(args, cfg);
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n\n{}", e.what(), runtime::usage());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Failed to load configuration: {}\n", e.what());
        return EXIT_FAILURE;
    }

    try {
        Registry::init(cfg.logging);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        auto targets = buildTargets(cfg);
        const auto creds = runtime::Credentials::fromEnvironment(cfg.ftp);

        Registry::ps2mcs()->info("[*] Connecting to {}:{}...", cfg.ftp.host, cfg.ftp.port);
        auto session = std::make_unique<transport::FtpSession>(cfg.ftp, cfg.transfer, creds, shouldExit);

        std::unique_ptr<sync::Progress> reporter;
        if (cfg.sync.basic_output) reporter = std::make_unique<progress::Basic>();
        else reporter = std::make_unique<progress::Bar>();

        sync::Orchestrator orchestrator(std::move(session), std::move(targets), cfg, *reporter, shouldExit);
        const auto report = orchestrator.run();

        if (report.cancelled) {
            Registry::ps2mcs()->warn("[!] Sync interrupted");
            Registry::shutdown();
            return EXIT_CANCELLED;
        }

        if (report.failed > 0) Registry::ps2mcs()->warn("[-] {} target(s) failed", report.failed);
        else Registry::ps2mcs()->info("[✓] All targets in sync");

        Registry::shutdown();
        return report.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const sync::CancelledError&) {
        Registry::ps2mcs()->warn("[!] Sync interrupted");
        Registry::shutdown();
        return EXIT_CANCELLED;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) {
            Registry::ps2mcs()->error("Failed to sync: {}", e.what());
            Registry::shutdown();
        } else fmt::print(stderr, "Failed to sync: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
