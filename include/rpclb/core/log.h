#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <chlog/chlog.hpp>

namespace rpclb::log {

inline constexpr std::string_view kDefaultPattern = "[{date} {time}.{ms}][{lvl}][tid={tid}] {msg}";

struct LogOptions {
    std::string level = "info";
    // chlog pattern; only the first Init() picks it up.
    std::string pattern = std::string(kDefaultPattern);
};

// Thread-safe. The logger is created once; later calls only change the level.
void Init(const LogOptions& options);
void Init(std::string_view level);

// Thread-safe after Init(); always returns a valid logger.
chlog::logger& Get();

// Unknown names map to info.
chlog::level ParseLevel(std::string_view level);
bool IsKnownLevel(std::string_view level);

template <class... Args>
inline void debug(std::format_string<Args...> fmt, Args&&... args) {
    Get().debug(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void info(std::format_string<Args...> fmt, Args&&... args) {
    Get().info(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void warn(std::format_string<Args...> fmt, Args&&... args) {
    Get().warn(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void error(std::format_string<Args...> fmt, Args&&... args) {
    Get().error(fmt, std::forward<Args>(args)...);
}

} // namespace rpclb::log
