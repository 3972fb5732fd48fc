#pragma once
/// @file SpPipeline.hpp
/// @brief SpPipeline 公开接口

#include "stage_commands.hpp"
#include "video_pipeline.hpp"
#include "batch.hpp"

// 对外暴露：
// - 配置: PipelineConfig, PipelineOptions, BatchOptions
// - 命令构造: extract_frames_command(), feature_extractor_command(), ...
// - 单视频流水线: Job, JobStatus, decide_job_status(), VideoPipeline, PipelineOutcome
// - 批处理: run_batch(), summarize(), log_summary(), BatchSummary
