#include "logging/LogRegistry.hpp"

#include <stdexcept>

namespace osync::logging {

void LogRegistry::init(const std::filesystem::path& logDir, const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_ = log_dir_ / "orcasync.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    // console (stderr so it never mixes into command output)
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name,
                          const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.subsystem_levels;
    makeLogger("orcasync", sub_levels.orcasync);
    makeLogger("config",   sub_levels.config);
    makeLogger("snapshot", sub_levels.snapshot);
    makeLogger("baseline", sub_levels.baseline);
    makeLogger("sync",     sub_levels.sync);
    makeLogger("vcs",      sub_levels.vcs);
    makeLogger("shell",    sub_levels.shell);

    initialized_ = true;
    orcasync()->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::setConsoleLevel(const spdlog::level::level_enum level) {
    if (!initialized_) return;
    console_sink_->set_level(level);

    // A logger's own level filters before its sinks do.
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->level() > level) lg->set_level(level);
    });
}

void LogRegistry::shutdown() {
    if (!initialized_) return;
    for (const auto* name : SUBSYSTEMS) {
        if (const auto lg = spdlog::get(name)) lg->flush();
        spdlog::drop(name);
    }
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

}
