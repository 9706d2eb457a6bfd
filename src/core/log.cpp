#include <rpclb/core/log.h>

#include <array>
#include <memory>
#include <mutex>

namespace rpclb::log {
namespace {

struct LevelName {
    std::string_view name;
    chlog::level level;
};

constexpr std::array<LevelName, 8> kLevels{{
    {"trace", chlog::level::trace},
    {"debug", chlog::level::debug},
    {"info", chlog::level::info},
    {"warn", chlog::level::warn},
    {"warning", chlog::level::warn},
    {"error", chlog::level::error},
    {"critical", chlog::level::critical},
    {"off", chlog::level::off},
}};

std::once_flag g_once;
std::unique_ptr<chlog::logger> g_logger;

} // namespace

bool IsKnownLevel(std::string_view level) {
    for (const auto& l : kLevels) {
        if (l.name == level) {
            return true;
        }
    }
    return false;
}

chlog::level ParseLevel(std::string_view level) {
    for (const auto& l : kLevels) {
        if (l.name == level) {
            return l.level;
        }
    }
    return chlog::level::info;
}

void Init(const LogOptions& options) {
    std::call_once(g_once, [&options] {
        chlog::logger_config cfg;
        cfg.name = "rpclb";
        cfg.level = chlog::level::info;
        cfg.pattern = options.pattern.empty() ? std::string(kDefaultPattern) : options.pattern;
        cfg.async.enabled = false;
        cfg.parallel_sinks = false;

        g_logger = std::make_unique<chlog::logger>(std::move(cfg));
        g_logger->add_sink(std::make_shared<chlog::console_sink>(chlog::console_sink::style::color));
    });

    g_logger->set_level(ParseLevel(options.level));
}

void Init(std::string_view level) {
    LogOptions options;
    options.level = std::string(level);
    Init(options);
}

chlog::logger& Get() {
    if (!g_logger) {
        Init(LogOptions{});
    }
    return *g_logger;
}

} // namespace rpclb::log
