#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <stdexcept>
#include <vector>

namespace mcs::log {

void Registry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;
    if (!fs::exists(cfg.log_dir)) fs::create_directories(cfg.log_dir);
    main_log_path_ = cfg.log_dir / "ps2mcs.log";

    std::vector<spdlog::sink_ptr> sinks;

    if (cfg.console) {
        console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink_->set_level(cfg.levels.console_log_level);
        console_sink_->set_color_mode(spdlog::color_mode::automatic);
        console_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(console_sink_);
    }

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cfg.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);
    sinks.push_back(main_file_sink_);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cfg.levels.subsystem_levels;
    makeLogger("ps2mcs", sub_levels.ps2mcs);
    makeLogger("sync",   sub_levels.sync);
    makeLogger("ftp",    sub_levels.ftp);
    makeLogger("fs",     sub_levels.fs);

    initialized_ = true;
    get("ps2mcs")->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    for (const auto* name : {"ps2mcs", "sync", "ftp", "fs"}) spdlog::drop(name);
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
