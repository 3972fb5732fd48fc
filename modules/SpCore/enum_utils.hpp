#pragma once
/// @file enum_utils.hpp
/// @brief 枚举工具 (基于 magic_enum)

#include <magic_enum/magic_enum.hpp>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace sp::core {

/// @brief 枚举转字符串
template <typename E>
[[nodiscard]] constexpr std::string_view enum_name(E value) noexcept {
    return magic_enum::enum_name(value);
}

/// @brief 枚举转小写字符串，用于日志和命令行 (Stage::Extract -> "extract")
template <typename E>
[[nodiscard]] std::string enum_name_lower(E value) {
    std::string name(magic_enum::enum_name(value));
    for (char& c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return name;
}

/// @brief 字符串转枚举 (返回 optional)
template <typename E>
[[nodiscard]] constexpr std::optional<E> enum_cast(std::string_view name) noexcept {
    return magic_enum::enum_cast<E>(name);
}

/// @brief 字符串转枚举，忽略大小写 ("GLOMAP" / "glomap" / "Glomap")
template <typename E>
[[nodiscard]] constexpr std::optional<E> enum_cast_icase(std::string_view name) noexcept {
    return magic_enum::enum_cast<E>(name, magic_enum::case_insensitive);
}

/// @brief 获取所有枚举值
template <typename E>
[[nodiscard]] constexpr auto enum_values() noexcept {
    return magic_enum::enum_values<E>();
}

/// @brief 获取枚举值数量
template <typename E>
[[nodiscard]] constexpr std::size_t enum_count() noexcept {
    return magic_enum::enum_count<E>();
}

}  // namespace sp::core
