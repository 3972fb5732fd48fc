/// @file core.cpp
#include "core.hpp"
#include <magic_enum/magic_enum.hpp>

namespace sp::core {

std::string_view error_code_name(ErrorCode code) noexcept {
    return magic_enum::enum_name(code);
}

std::string_view version() noexcept {
    return "0.1.0";
}

}  // namespace sp::core
