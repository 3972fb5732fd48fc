#pragma once
/// @file log.hpp
/// @brief ScenePipe 日志系统 (基于 spdlog)

#include "core.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>

namespace sp::core {

// ============================================================================
// 日志级别
// ============================================================================
enum class LogLevel : uint8_t {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarn,
    kError,
    kCritical,
    kOff,
};

/// @brief 解析命令行中的日志级别 ("trace", "debug", "info", "warn", "error", "critical", "off")
[[nodiscard]] SPCORE_API std::optional<LogLevel> log_level_from_string(std::string_view name);

// ============================================================================
// 日志类
// ============================================================================
class SPCORE_API Log {
public:
    /// @brief 初始化日志系统
    /// @param name 日志器名称
    /// @param level 日志级别
    /// @param pattern 日志格式 (spdlog pattern)
    static void init(
        std::string_view name = "scenepipe",
        LogLevel level = LogLevel::kInfo,
        std::string_view pattern = "[%H:%M:%S] [%^%l%$] %v");

    /// @brief 设置日志级别
    static void set_level(LogLevel level);

    /// @brief 获取日志级别
    [[nodiscard]] static LogLevel level();

    /// @brief 获取 spdlog logger (高级用法)，可与 init 并发调用
    [[nodiscard]] static std::shared_ptr<spdlog::logger> logger();

    // 便捷日志函数
    template <typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->trace(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->debug(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->info(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->warn(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->error(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// 便捷宏
// ============================================================================
#define SP_TRACE(...)    ::sp::core::Log::trace(__VA_ARGS__)
#define SP_DEBUG(...)    ::sp::core::Log::debug(__VA_ARGS__)
#define SP_INFO(...)     ::sp::core::Log::info(__VA_ARGS__)
#define SP_WARN(...)     ::sp::core::Log::warn(__VA_ARGS__)
#define SP_ERROR(...)    ::sp::core::Log::error(__VA_ARGS__)
#define SP_CRITICAL(...) ::sp::core::Log::critical(__VA_ARGS__)

}  // namespace sp::core
