/// @file stage_commands.cpp
#include "stage_commands.hpp"
#include <algorithm>
#include <thread>

namespace sp::pipeline {

namespace {

[[nodiscard]] const char* flag(bool value) noexcept {
    return value ? "1" : "0";
}

}  // namespace

tools::StageCommand extract_frames_command(
    const tools::ToolPaths& tools, const std::filesystem::path& video,
    const io::SceneDirectories& dirs, const PipelineConfig& config) {
    tools::StageCommand cmd;
    cmd.stage = tools::Stage::Extract;
    cmd.executable = tools.ffmpeg;
    cmd.arguments = {
        "-i", video.string(),
        "-qscale:v", std::to_string(config.frame_quality),
        (dirs.images / config.frame_pattern).string(),
    };
    return cmd;
}

tools::StageCommand feature_extractor_command(
    const tools::ToolPaths& tools, const io::SceneDirectories& dirs, const PipelineConfig& config) {
    tools::StageCommand cmd;
    cmd.stage = tools::Stage::Features;
    cmd.executable = tools.colmap;
    cmd.arguments = {
        "feature_extractor",
        "--database_path", dirs.database.string(),
        "--image_path", dirs.images.string(),
        "--ImageReader.single_camera", flag(config.single_camera),
        "--SiftExtraction.use_gpu", flag(config.use_gpu),
        "--SiftExtraction.max_image_size", std::to_string(config.max_image_size),
    };
    return cmd;
}

tools::StageCommand sequential_matcher_command(
    const tools::ToolPaths& tools, const io::SceneDirectories& dirs, const PipelineConfig& config) {
    tools::StageCommand cmd;
    cmd.stage = tools::Stage::Match;
    cmd.executable = tools.colmap;
    cmd.arguments = {
        "sequential_matcher",
        "--database_path", dirs.database.string(),
        "--SequentialMatching.overlap", std::to_string(config.sequential_overlap),
    };
    return cmd;
}

tools::StageCommand mapper_command(
    const tools::ToolPaths& tools, tools::MapperEngine engine,
    const io::SceneDirectories& dirs, const PipelineConfig& config) {
    tools::StageCommand cmd;
    cmd.stage = tools::Stage::Mapper;
    cmd.executable = tools.mapper;
    cmd.arguments = {
        "mapper",
        "--database_path", dirs.database.string(),
        "--image_path", dirs.images.string(),
        "--output_path", dirs.sparse.string(),
    };

    if (engine == tools::MapperEngine::Colmap) {
        unsigned threads = config.mapper_threads;
        if (threads == 0) {
            threads = std::max(1u, std::thread::hardware_concurrency());
        }
        cmd.arguments.push_back("--Mapper.num_threads");
        cmd.arguments.push_back(std::to_string(threads));
    }
    return cmd;
}

tools::StageCommand model_converter_command(
    const tools::ToolPaths& tools, const std::filesystem::path& input,
    const std::filesystem::path& output) {
    tools::StageCommand cmd;
    cmd.stage = tools::Stage::Export;
    cmd.executable = tools.colmap;
    cmd.arguments = {
        "model_converter",
        "--input_path", input.string(),
        "--output_path", output.string(),
        "--output_type", "TXT",
    };
    return cmd;
}

}  // namespace sp::pipeline
