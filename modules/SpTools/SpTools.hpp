#pragma once
/// @file SpTools.hpp
/// @brief SpTools 公开接口

#include "tool_locator.hpp"
#include "environment.hpp"
#include "stage_runner.hpp"

// 对外暴露：
// - 工具定位: MapperEngine, ToolPaths, locate_tool(), locate_tools(), find_executable()
// - 子进程环境: ProcessEnvironment, make_environment()
// - 阶段执行: Stage, StageCommand, StageResult, StageRunner, ProcessStageRunner
