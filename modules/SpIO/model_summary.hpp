#pragma once
/// @file model_summary.hpp
/// @brief COLMAP 稀疏模型的统计信息 (用于结果汇报)

#include "scene_layout.hpp"
#include <cstdint>

namespace sp::io {

enum class ModelFormat : uint8_t {
    Binary = 0,
    Text,
};

struct ModelSummary {
    ModelFormat format = ModelFormat::Binary;
    uint64_t    num_cameras = 0;
    uint64_t    num_images = 0;    // 已注册的图像
    uint64_t    num_points3d = 0;
    size_t      num_frames = 0;    // 抽取的总帧数，由流水线填充
};

/// @brief 读取 COLMAP Binary 模型的元素数量 (只读文件头)
/// @param model_dir 包含 cameras.bin, images.bin, points3D.bin 的目录
[[nodiscard]] SPIO_API core::Result<ModelSummary> read_model_summary_binary(
    const std::filesystem::path& model_dir);

/// @brief 读取 COLMAP Text 模型的元素数量
/// @param model_dir 包含 cameras.txt, images.txt, points3D.txt 的目录
[[nodiscard]] SPIO_API core::Result<ModelSummary> read_model_summary_text(
    const std::filesystem::path& model_dir);

/// @brief 自动检测格式 (优先 binary)
[[nodiscard]] SPIO_API core::Result<ModelSummary> read_model_summary(
    const std::filesystem::path& model_dir);

}  // namespace sp::io
