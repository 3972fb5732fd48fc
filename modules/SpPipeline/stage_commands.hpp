#pragma once
/// @file stage_commands.hpp
/// @brief 各阶段外部工具的参数构造

#if defined(_WIN32)
  #ifdef SPPIPELINE_EXPORTS
    #define SPPIPELINE_API __declspec(dllexport)
  #else
    #define SPPIPELINE_API __declspec(dllimport)
  #endif
#else
  #define SPPIPELINE_API __attribute__((visibility("default")))
#endif

#include "SpCore.hpp"
#include "SpIO.hpp"
#include "SpTools.hpp"

namespace sp::pipeline {

// ============================================================================
// 流水线配置 (固定参数，不从视频内容推导)
// ============================================================================
struct PipelineConfig {
    int         frame_quality = 2;                  // ffmpeg -qscale:v
    std::string frame_pattern = "frame_%06d.jpg";
    bool        single_camera = true;               // --ImageReader.single_camera
    bool        use_gpu = true;                     // --SiftExtraction.use_gpu
    int         max_image_size = 4096;              // --SiftExtraction.max_image_size
    int         sequential_overlap = 15;            // --SequentialMatching.overlap
    unsigned    mapper_threads = 0;                 // colmap --Mapper.num_threads，0 表示硬件线程数
};

// ============================================================================
// 命令构造
// ============================================================================

/// @brief ffmpeg -i <video> -qscale:v 2 <images>/frame_%06d.jpg
[[nodiscard]] SPPIPELINE_API tools::StageCommand extract_frames_command(
    const tools::ToolPaths& tools, const std::filesystem::path& video,
    const io::SceneDirectories& dirs, const PipelineConfig& config);

/// @brief colmap feature_extractor
[[nodiscard]] SPPIPELINE_API tools::StageCommand feature_extractor_command(
    const tools::ToolPaths& tools, const io::SceneDirectories& dirs, const PipelineConfig& config);

/// @brief colmap sequential_matcher
[[nodiscard]] SPPIPELINE_API tools::StageCommand sequential_matcher_command(
    const tools::ToolPaths& tools, const io::SceneDirectories& dirs, const PipelineConfig& config);

/// @brief <colmap|glomap> mapper，colmap 额外指定线程数
[[nodiscard]] SPPIPELINE_API tools::StageCommand mapper_command(
    const tools::ToolPaths& tools, tools::MapperEngine engine,
    const io::SceneDirectories& dirs, const PipelineConfig& config);

/// @brief colmap model_converter --output_type TXT
[[nodiscard]] SPPIPELINE_API tools::StageCommand model_converter_command(
    const tools::ToolPaths& tools, const std::filesystem::path& input,
    const std::filesystem::path& output);

}  // namespace sp::pipeline
