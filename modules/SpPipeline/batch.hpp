#pragma once
/// @file batch.hpp
/// @brief 批量处理：枚举输入、逐个运行流水线、汇总结果

#include "video_pipeline.hpp"

namespace sp::pipeline {

// ============================================================================
// 批处理配置
// ============================================================================
struct BatchOptions {
    std::filesystem::path scenes_root = "scenes";
    tools::MapperEngine   engine = tools::MapperEngine::Glomap;
    bool                  force = false;  // 忽略已存在的场景目录
    size_t                jobs = 1;       // 并行视频数，1 为严格串行
    PipelineConfig        pipeline;
};

// ============================================================================
// 汇总
// ============================================================================
struct BatchSummary {
    std::vector<PipelineOutcome> outcomes;  // 与输入顺序一致
    size_t completed = 0;
    size_t skipped = 0;
    size_t failed = 0;

    [[nodiscard]] size_t total() const noexcept { return outcomes.size(); }

    /// 所有任务都失败 (空批次不算)
    [[nodiscard]] bool all_failed() const noexcept { return total() > 0 && failed == total(); }

    /// 进程退出码：全部失败为 1，否则为 0
    [[nodiscard]] int exit_code() const noexcept { return all_failed() ? 1 : 0; }
};

/// @brief 纯归约：统计各类结果数量
[[nodiscard]] SPPIPELINE_API BatchSummary summarize(std::vector<PipelineOutcome> outcomes);

/// @brief 运行整个批次
/// @param videos 已展开的视频列表
/// @param tools  已解析的工具路径 (在此之前必须全部找到)
/// @param runner 阶段执行器；并行模式下会被多个线程同时调用
[[nodiscard]] SPPIPELINE_API BatchSummary run_batch(
    const std::vector<std::filesystem::path>& videos,
    const BatchOptions& options,
    const tools::ToolPaths& tools,
    tools::StageRunner& runner);

/// @brief 输出汇总信息
SPPIPELINE_API void log_summary(const BatchSummary& summary, const std::filesystem::path& scenes_root);

}  // namespace sp::pipeline
