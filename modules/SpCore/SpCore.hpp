#pragma once
/// @file SpCore.hpp
/// @brief SpCore 公开接口 - 只暴露必要的 API

#include "core.hpp"
#include "enum_utils.hpp"
#include "log.hpp"

// 对外暴露：
// - 错误处理 (Error, ErrorCode, Result<T>, make_error)
// - 日志系统 (Log, SP_INFO, ...)
// - 枚举工具 (enum_name, enum_name_lower, enum_cast, enum_cast_icase, ...)
// - version()
