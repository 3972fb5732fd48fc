/// @file log.cpp
#include "log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace sp::core {

std::shared_ptr<spdlog::logger> Log::logger_ = nullptr;

namespace {

std::mutex g_init_mutex;

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace:    return spdlog::level::trace;
        case LogLevel::kDebug:    return spdlog::level::debug;
        case LogLevel::kInfo:     return spdlog::level::info;
        case LogLevel::kWarn:     return spdlog::level::warn;
        case LogLevel::kError:    return spdlog::level::err;
        case LogLevel::kCritical: return spdlog::level::critical;
        case LogLevel::kOff:      return spdlog::level::off;
        default:                  return spdlog::level::info;
    }
}

LogLevel from_spdlog_level(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::kTrace;
        case spdlog::level::debug:    return LogLevel::kDebug;
        case spdlog::level::info:     return LogLevel::kInfo;
        case spdlog::level::warn:     return LogLevel::kWarn;
        case spdlog::level::err:      return LogLevel::kError;
        case spdlog::level::critical: return LogLevel::kCritical;
        case spdlog::level::off:      return LogLevel::kOff;
        default:                      return LogLevel::kInfo;
    }
}

void init_locked(std::shared_ptr<spdlog::logger>& logger, std::string_view name,
                 LogLevel level, std::string_view pattern) {
    // 同名 logger 已注册时先移除，允许重复 init
    spdlog::drop(std::string(name));
    logger = spdlog::stdout_color_mt(std::string(name));
    logger->set_level(to_spdlog_level(level));
    logger->set_pattern(std::string(pattern));
}

}  // namespace

std::optional<LogLevel> log_level_from_string(std::string_view name) {
    // spdlog 对未知名称返回 off，需要区分真正的 "off"
    const auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return from_spdlog_level(level);
}

void Log::init(std::string_view name, LogLevel level, std::string_view pattern) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    init_locked(logger_, name, level, pattern);
}

void Log::set_level(LogLevel level) {
    logger()->set_level(to_spdlog_level(level));
}

LogLevel Log::level() {
    return from_spdlog_level(logger()->level());
}

std::shared_ptr<spdlog::logger> Log::logger() {
    // 懒初始化；并行批处理时工作线程可能先于 init 调用。
    // 按值返回，init 替换 logger_ 时调用方仍持有旧 logger
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (!logger_) {
        init_locked(logger_, "scenepipe", LogLevel::kInfo, "[%H:%M:%S] [%^%l%$] %v");
    }
    return logger_;
}

}  // namespace sp::core
