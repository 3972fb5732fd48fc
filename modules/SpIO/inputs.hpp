#pragma once
/// @file inputs.hpp
/// @brief 输入视频列表展开

#include "scene_layout.hpp"
#include <vector>

namespace sp::io {

/// @brief 是否为视频文件 (.mp4 .mov .avi .mkv .m4v .webm，忽略大小写)
[[nodiscard]] SPIO_API bool is_video_file(const std::filesystem::path& path);

/// @brief 展开命令行输入
/// - 目录：取其中 (不递归) 的视频文件，按文件名排序
/// - 其他：原样保留 (包括不存在的路径，由流水线报告)
[[nodiscard]] SPIO_API std::vector<std::filesystem::path> expand_inputs(
    const std::vector<std::filesystem::path>& inputs);

}  // namespace sp::io
