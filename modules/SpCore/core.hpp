#pragma once
/// @file core.hpp
/// @brief SpCore 内部实现

// ============================================================================
// DLL 导出宏
// ============================================================================
#if defined(_WIN32)
  #ifdef SPCORE_EXPORTS
    #define SPCORE_API __declspec(dllexport)
  #else
    #define SPCORE_API __declspec(dllimport)
  #endif
#else
  #define SPCORE_API __attribute__((visibility("default")))
#endif

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sp::core {

// ============================================================================
// 错误处理
// ============================================================================
enum class ErrorCode : uint32_t {
    kSuccess = 0,
    kFileNotFound,
    kParseError,
    kInvalidArgument,
    kToolNotFound,       // 外部工具缺失，整个批次终止
    kDirectoryCreation,  // 场景目录创建失败，仅影响当前视频
    kStageFailure,       // 外部工具返回非零
    kNoOutputProduced,   // 工具返回 0 但没有产出
    kLaunchFailure,      // 子进程无法启动
};

struct Error {
    ErrorCode   code = ErrorCode::kSuccess;
    std::string message;
    [[nodiscard]] bool ok() const noexcept { return code == ErrorCode::kSuccess; }
};

// ============================================================================
// C++17 兼容的 Expected 实现
// ============================================================================
template <typename E>
struct Unexpected {
    E error;
    explicit Unexpected(E e) : error(std::move(e)) {}
};

template <typename E>
Unexpected<std::decay_t<E>> unexpected(E&& e) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(e));
}

template <typename T, typename E>
class Expected {
    std::variant<T, E> data_;

public:
    Expected(T value) : data_(std::move(value)) {}
    Expected(Unexpected<E> err) : data_(std::move(err.error)) {}

    [[nodiscard]] bool has_value() const noexcept { return std::holds_alternative<T>(data_); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] E& error() & { return std::get<E>(data_); }
    [[nodiscard]] const E& error() const& { return std::get<E>(data_); }
    [[nodiscard]] E&& error() && { return std::get<E>(std::move(data_)); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
};

// void 特化：用于只返回成功/失败的函数
template <typename E>
class Expected<void, E> {
    std::optional<E> error_;

public:
    Expected() = default;
    Expected(Unexpected<E> err) : error_(std::move(err.error)) {}

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] E& error() & { return *error_; }
    [[nodiscard]] const E& error() const& { return *error_; }
};

template <typename T>
using Result = Expected<T, Error>;

/// @brief 构造错误的便捷函数
[[nodiscard]] inline Unexpected<Error> make_error(ErrorCode code, std::string message) {
    return Unexpected<Error>(Error{code, std::move(message)});
}

/// @brief 错误码名称 (用于日志)
[[nodiscard]] SPCORE_API std::string_view error_code_name(ErrorCode code) noexcept;

// ============================================================================
// 版本
// ============================================================================
[[nodiscard]] SPCORE_API std::string_view version() noexcept;

}  // namespace sp::core
