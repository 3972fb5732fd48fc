#pragma once
/// @file SpIO.hpp
/// @brief SpIO 公开接口

#include "scene_layout.hpp"
#include "inputs.hpp"
#include "model_summary.hpp"

// 对外暴露：
// - 场景目录: SceneDirectories, SceneLayout, count_frames()
// - 输入展开: is_video_file(), expand_inputs()
// - 模型统计: ModelSummary, read_model_summary(), read_model_summary_binary(), read_model_summary_text()
