/// @file video_pipeline.cpp
#include "video_pipeline.hpp"

namespace sp::pipeline {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] PipelineOutcome make_outcome(const Job& job, OutcomeStatus status) {
    PipelineOutcome outcome;
    outcome.video_name = job.name;
    outcome.video = job.video;
    outcome.status = std::move(status);
    return outcome;
}

[[nodiscard]] PipelineOutcome fail(const Job& job, tools::Stage stage, core::Error error) {
    SP_ERROR("{} [FAIL] {} failed: {}", job.tag(), tools::stage_name(stage), error.message);
    return make_outcome(job, FailedAtStage{stage, std::move(error)});
}

}  // namespace

std::string Job::tag() const {
    return "[" + std::to_string(index) + "/" + std::to_string(total) + " " + name + "]";
}

std::vector<Job> make_jobs(const std::vector<fs::path>& videos) {
    std::vector<Job> jobs;
    jobs.reserve(videos.size());
    for (size_t i = 0; i < videos.size(); ++i) {
        Job job;
        job.video = videos[i];
        job.name  = videos[i].stem().string();
        job.index = i + 1;
        job.total = videos.size();
        jobs.push_back(std::move(job));
    }
    return jobs;
}

VideoPipeline::VideoPipeline(const tools::ToolPaths& tools, const io::SceneLayout& layout,
                             tools::StageRunner& runner, PipelineConfig config, PipelineOptions options)
    : tools_(tools), layout_(layout), runner_(runner),
      config_(std::move(config)), options_(options) {}

PipelineOutcome VideoPipeline::run(const Job& job) const {
    SP_INFO("=== {} Processing {} ===", job.tag(), job.video.string());

    // ---- Init ----
    // 在跳过判断之前检查：stem 为 ".." 时场景目录会解析到 scenes_root 的父目录
    if (!io::is_valid_scene_name(job.name)) {
        return fail(job, tools::Stage::Prepare,
                    {core::ErrorCode::kInvalidArgument,
                     "Video name '" + job.name + "' cannot be used as a scene directory: " +
                     job.video.string()});
    }

    const io::SceneDirectories dirs = layout_.layout_for(job.name);
    const JobStatus status = decide_job_status(io::SceneLayout::exists(dirs), options_.force);

    if (status == JobStatus::kSkip) {
        SP_INFO("{} [SKIP] {} - already processed ({})", job.tag(), job.name, dirs.root.string());
        return make_outcome(job, Skipped{"scene directory exists: " + dirs.root.string()});
    }

    std::error_code ec;
    if (!fs::is_regular_file(job.video, ec)) {
        return fail(job, tools::Stage::Prepare,
                    {core::ErrorCode::kFileNotFound, "Input video not found: " + job.video.string()});
    }

    if (auto made = io::SceneLayout::materialize(dirs, status == JobStatus::kRerun); !made) {
        return fail(job, tools::Stage::Prepare, made.error());
    }

    // ---- 1. 抽帧 ----
    SP_INFO("{} [1/4] Extracting frames...", job.tag());
    {
        const auto result = run_stage(job, dirs, extract_frames_command(tools_, job.video, dirs, config_));
        if (!result.success) {
            return fail(job, tools::Stage::Extract, result.to_error());
        }
    }
    // 退出码为 0 不代表有输出，至少要有一帧
    const size_t num_frames = io::count_frames(dirs.images);
    if (num_frames == 0) {
        return fail(job, tools::Stage::Extract,
                    {core::ErrorCode::kNoOutputProduced,
                     "No frames were written to " + dirs.images.string()});
    }
    SP_INFO("{} Extracted {} frames", job.tag(), num_frames);

    // ---- 2. 特征提取 ----
    SP_INFO("{} [2/4] Feature extraction...", job.tag());
    {
        const auto result = run_stage(job, dirs, feature_extractor_command(tools_, dirs, config_));
        if (!result.success) {
            return fail(job, tools::Stage::Features, result.to_error());
        }
    }

    // ---- 3. 顺序匹配 ----
    SP_INFO("{} [3/4] Feature matching...", job.tag());
    {
        const auto result = run_stage(job, dirs, sequential_matcher_command(tools_, dirs, config_));
        if (!result.success) {
            return fail(job, tools::Stage::Match, result.to_error());
        }
    }

    // ---- 4. 稀疏重建 ----
    SP_INFO("{} [4/4] Sparse reconstruction ({})...", job.tag(),
            core::enum_name_lower(options_.engine));
    {
        const auto result = run_stage(job, dirs, mapper_command(tools_, options_.engine, dirs, config_));
        if (!result.success) {
            return fail(job, tools::Stage::Mapper, result.to_error());
        }
    }

    // ---- 导出 (尽力而为) ----
    Completed completed;
    completed.exported = export_model(job, dirs);

    if (completed.exported) {
        if (auto summary = io::read_model_summary(dirs.primary_model())) {
            summary->num_frames = num_frames;
            SP_INFO("{} Registered {}/{} frames, {} points", job.tag(),
                    summary->num_images, num_frames, summary->num_points3d);
            completed.model = std::move(*summary);
        } else {
            SP_WARN("{} Could not read model summary: {}", job.tag(), summary.error().message);
        }
    } else {
        SP_INFO("{} No primary model at {}, export skipped",
                job.tag(), dirs.primary_model().string());
    }

    SP_INFO("{} Finished {}", job.tag(), job.name);
    return make_outcome(job, std::move(completed));
}

tools::StageResult VideoPipeline::run_stage(
    const Job& job, const io::SceneDirectories& dirs, const tools::StageCommand& command) const {
    tools::StageContext context;
    if (options_.capture_output) {
        context.output = tools::OutputMode::kFile;
        context.log_file = dirs.logs / (tools::stage_name(command.stage) + ".log");
        SP_DEBUG("{} {} output -> {}", job.tag(), tools::stage_name(command.stage), context.log_file.string());
    }

    std::unique_lock<std::mutex> gpu_lock;
    if (options_.gpu_gate && is_gpu_stage(command.stage)) {
        gpu_lock = std::unique_lock<std::mutex>(*options_.gpu_gate);
    }
    return runner_.run(command, context);
}

bool VideoPipeline::export_model(const Job& job, const io::SceneDirectories& dirs) const {
    const fs::path model = dirs.primary_model();
    std::error_code ec;
    if (!fs::is_directory(model, ec)) {
        return false;
    }

    SP_INFO("{} Exporting model to TXT...", job.tag());
    tools::StageContext quiet;
    quiet.output = tools::OutputMode::kDiscard;

    // sparse/0 -> sparse/0，再展开到 sparse/ 供下游按固定相对路径读取
    for (const fs::path& target : {model, dirs.sparse}) {
        const auto result = runner_.run(model_converter_command(tools_, model, target), quiet);
        if (!result.success) {
            SP_WARN("{} model_converter -> {} failed: {}", job.tag(), target.string(),
                    result.to_error().message);
        }
    }
    return true;
}

}  // namespace sp::pipeline
