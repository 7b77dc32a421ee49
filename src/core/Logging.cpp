#include "Logging.h"

#include <cstdlib>
#include <vector>
#include <chrono>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace core {

static std::string_view trim(std::string_view s) {
    auto is_space = [](unsigned char c){ return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    size_t b = 0, e = s.size();
    while (b < e && is_space(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && is_space(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

spdlog::level::level_enum parse_log_level(std::string_view s, spdlog::level::level_enum fallback) {
    s = trim(s);
    if (s.empty()) return fallback;
    if (s == "trace") return spdlog::level::trace;
    if (s == "debug") return spdlog::level::debug;
    if (s == "info") return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error" || s == "err") return spdlog::level::err;
    if (s == "critical" || s == "crit" || s == "fatal") return spdlog::level::critical;
    if (s == "off" || s == "none" || s == "quiet") return spdlog::level::off;
    return fallback;
}

LogInitConfig determine_log_config(int argc, char** argv, spdlog::level::level_enum default_level) {
    LogInitConfig cfg{}; cfg.level = default_level; cfg.use_color = true;

    if (const char* env_lvl = std::getenv("KYZU_LOG_LEVEL")) {
        cfg.level = parse_log_level(env_lvl, cfg.level);
    }
    if (const char* env_file = std::getenv("KYZU_LOG_FILE")) {
        if (env_file[0] != '\0') cfg.file_path = env_file;
    }
    if (const char* env_color = std::getenv("KYZU_LOG_COLOR")) {
        std::string_view v = trim(env_color);
        if (v == "0" || v == "off" || v == "false" || v == "no") cfg.use_color = false;
    }

    // CLI overrides env
    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i] ? argv[i] : "";
        if (a == "--log-level" && i + 1 < argc) {
            cfg.level = parse_log_level(argv[i + 1], cfg.level);
            ++i;
        } else if (a.rfind("--log-level=", 0) == 0) {
            cfg.level = parse_log_level(a.substr(std::string_view("--log-level=").size()), cfg.level);
        } else if (a == "--log-file" && i + 1 < argc) {
            cfg.file_path = argv[++i];
        } else if (a.rfind("--log-file=", 0) == 0) {
            cfg.file_path = std::string(a.substr(std::string_view("--log-file=").size()));
        } else if (a == "--no-color") {
            cfg.use_color = false;
        } else if (a == "-v" || a == "--verbose") {
            // Per-frame camera deltas are logged at trace.
            cfg.level = (a == "-v") ? spdlog::level::debug : spdlog::level::trace;
        } else if (a == "-q" || a == "--quiet") {
            cfg.level = spdlog::level::warn;
        }
    }
    return cfg;
}

void init_logging(const LogInitConfig& cfg) {
    const char* pattern = "[%H:%M:%S.%e] [tid %t] [%^%l%$] %v";

    std::vector<spdlog::sink_ptr> sinks;
    if (cfg.use_color) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }

    std::string fileSinkError;
    if (!cfg.file_path.empty()) {
        // 5 MB per file, keep 3 files
        constexpr std::size_t max_size = 5 * 1024 * 1024;
        constexpr std::size_t max_files = 3;
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.file_path, max_size, max_files));
        } catch (const spdlog::spdlog_ex& ex) {
            fileSinkError = ex.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("kyzu", sinks.begin(), sinks.end());
    logger->set_level(cfg.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::set_level(cfg.level);
    spdlog::set_pattern(pattern);

    spdlog::flush_every(std::chrono::seconds(1));

    if (!fileSinkError.empty()) {
        spdlog::warn("Log file '{}' unavailable, console only: {}", cfg.file_path, fileSinkError);
    }
    spdlog::info("Logging initialized (level={}, file={})",
                 spdlog::level::to_string_view(cfg.level),
                 cfg.file_path.empty() || !fileSinkError.empty() ? "none" : cfg.file_path.c_str());
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace core
