#pragma once
/// @file video_pipeline.hpp
/// @brief 单个视频的重建流水线 (状态机)
///
/// Init -> FramesExtracted -> FeaturesExtracted -> Matched -> Mapped -> Exported
/// Skipped 只能从 Init 到达；任一非终止状态都可能进入 Failed(stage)。

#include "stage_commands.hpp"
#include <mutex>
#include <optional>
#include <variant>

namespace sp::pipeline {

// ============================================================================
// 任务
// ============================================================================
struct Job {
    std::filesystem::path video;
    std::string           name;       // 视频 stem，同时是场景目录名
    size_t                index = 0;  // 从 1 开始
    size_t                total = 0;

    /// 日志前缀 "[2/5 clip]"
    [[nodiscard]] SPPIPELINE_API std::string tag() const;
};

/// @brief 为输入列表分配序号
[[nodiscard]] SPPIPELINE_API std::vector<Job> make_jobs(const std::vector<std::filesystem::path>& videos);

// ============================================================================
// 任务状态 (在任务开始时计算一次)
// ============================================================================
enum class JobStatus : uint8_t {
    kRun = 0,  // 场景不存在，正常处理
    kSkip,     // 场景已存在，跳过
    kRerun,    // 场景已存在但指定了 --force，清空后重跑
};

[[nodiscard]] constexpr JobStatus decide_job_status(bool scene_exists, bool force) noexcept {
    if (!scene_exists) return JobStatus::kRun;
    return force ? JobStatus::kRerun : JobStatus::kSkip;
}

// ============================================================================
// 结果
// ============================================================================
struct Completed {
    bool                            exported = false;  // sparse/0 存在并已尝试导出
    std::optional<io::ModelSummary> model;
};

struct Skipped {
    std::string reason;
};

struct FailedAtStage {
    tools::Stage stage = tools::Stage::Prepare;
    core::Error  error;
};

using OutcomeStatus = std::variant<Completed, Skipped, FailedAtStage>;

struct PipelineOutcome {
    std::string           video_name;
    std::filesystem::path video;
    OutcomeStatus         status = Completed{};

    [[nodiscard]] bool completed() const noexcept { return std::holds_alternative<Completed>(status); }
    [[nodiscard]] bool skipped() const noexcept { return std::holds_alternative<Skipped>(status); }
    [[nodiscard]] bool failed() const noexcept { return std::holds_alternative<FailedAtStage>(status); }

    /// 失败阶段，未失败时为 nullopt
    [[nodiscard]] std::optional<tools::Stage> failed_stage() const noexcept {
        if (const auto* f = std::get_if<FailedAtStage>(&status)) return f->stage;
        return std::nullopt;
    }
};

/// @brief 该阶段是否占用 GPU (并行模式下需串行化)
[[nodiscard]] constexpr bool is_gpu_stage(tools::Stage stage) noexcept {
    return stage == tools::Stage::Features || stage == tools::Stage::Match ||
           stage == tools::Stage::Mapper;
}

// ============================================================================
// 流水线
// ============================================================================
struct PipelineOptions {
    tools::MapperEngine engine = tools::MapperEngine::Glomap;
    bool                force = false;
    bool                capture_output = false;  // true: 工具输出写入 <scene>/logs/<stage>.log
    std::mutex*         gpu_gate = nullptr;      // 非空时 GPU 阶段互斥执行
};

class SPPIPELINE_API VideoPipeline {
public:
    VideoPipeline(const tools::ToolPaths& tools, const io::SceneLayout& layout,
                  tools::StageRunner& runner, PipelineConfig config, PipelineOptions options);

    /// @brief 处理一个视频；任何单视频错误都以 FailedAtStage 返回，不会抛出
    [[nodiscard]] PipelineOutcome run(const Job& job) const;

private:
    [[nodiscard]] tools::StageResult run_stage(
        const Job& job, const io::SceneDirectories& dirs, const tools::StageCommand& command) const;

    /// sparse/0 存在时导出两份 TXT，失败只记录警告
    [[nodiscard]] bool export_model(const Job& job, const io::SceneDirectories& dirs) const;

    const tools::ToolPaths& tools_;
    const io::SceneLayout&  layout_;
    tools::StageRunner&     runner_;
    PipelineConfig          config_;
    PipelineOptions         options_;
};

}  // namespace sp::pipeline
