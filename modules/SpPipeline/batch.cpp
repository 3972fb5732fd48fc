/// @file batch.cpp
#include "batch.hpp"
#include <algorithm>
#include <cctype>
#include <queue>
#include <thread>
#include <unordered_map>

namespace sp::pipeline {

namespace fs = std::filesystem;

namespace {

constexpr const char* kRule = "--------------------------------------------------------------";

/// @brief 线程安全的任务队列，元素为 jobs 中的下标
class JobQueue {
public:
    explicit JobQueue(const std::vector<size_t>& indices) {
        for (size_t i : indices) queue_.push(i);
    }

    std::optional<size_t> pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        const size_t index = queue_.front();
        queue_.pop();
        return index;
    }

private:
    std::mutex         mutex_;
    std::queue<size_t> queue_;
};

/// @brief 场景名的冲突键：忽略 ASCII 大小写
std::string collision_key(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

}  // namespace

BatchSummary summarize(std::vector<PipelineOutcome> outcomes) {
    BatchSummary summary;
    for (const auto& outcome : outcomes) {
        if (outcome.completed()) {
            ++summary.completed;
        } else if (outcome.skipped()) {
            ++summary.skipped;
        } else {
            ++summary.failed;
        }
    }
    summary.outcomes = std::move(outcomes);
    return summary;
}

BatchSummary run_batch(
    const std::vector<fs::path>& videos,
    const BatchOptions& options,
    const tools::ToolPaths& tools,
    tools::StageRunner& runner) {
    const std::vector<Job> jobs = make_jobs(videos);

    SP_INFO("{}", kRule);
    SP_INFO(" Starting on {} video(s)...", jobs.size());
    SP_INFO("{}", kRule);

    const io::SceneLayout layout(options.scenes_root);
    std::vector<std::optional<PipelineOutcome>> slots(jobs.size());

    // 同名 stem 会映射到同一个场景目录，只保留第一个。
    // 大小写不敏感的文件系统上 "Clip" 与 "clip" 也是同一目录，统一按小写比较
    std::vector<size_t> pending;
    std::unordered_map<std::string, size_t> claimed;
    for (size_t i = 0; i < jobs.size(); ++i) {
        const auto [it, inserted] = claimed.emplace(collision_key(jobs[i].name), jobs[i].index);
        if (inserted) {
            pending.push_back(i);
            continue;
        }
        SP_WARN("{} [SKIP] scene name '{}' is already used by job {} ({})",
                jobs[i].tag(), jobs[i].name, it->second, jobs[it->second - 1].video.string());
        PipelineOutcome outcome;
        outcome.video_name = jobs[i].name;
        outcome.video = jobs[i].video;
        outcome.status = Skipped{"duplicate scene name, already used by job " + std::to_string(it->second)};
        slots[i] = std::move(outcome);
    }

    const size_t workers = std::min(std::max<size_t>(options.jobs, 1), std::max<size_t>(pending.size(), 1));

    std::mutex gpu_gate;
    PipelineOptions pipeline_options;
    pipeline_options.engine = options.engine;
    pipeline_options.force = options.force;
    pipeline_options.capture_output = workers > 1;
    pipeline_options.gpu_gate = workers > 1 ? &gpu_gate : nullptr;

    const VideoPipeline pipeline(tools, layout, runner, options.pipeline, pipeline_options);

    if (workers == 1) {
        for (size_t i : pending) {
            slots[i] = pipeline.run(jobs[i]);
        }
    } else {
        SP_INFO("Running {} videos in parallel, tool output goes to <scene>/logs/", workers);
        JobQueue queue(pending);
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            threads.emplace_back([&]() {
                while (auto index = queue.pop()) {
                    slots[*index] = pipeline.run(jobs[*index]);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    std::vector<PipelineOutcome> outcomes;
    outcomes.reserve(slots.size());
    for (auto& slot : slots) {
        outcomes.push_back(std::move(*slot));
    }
    return summarize(std::move(outcomes));
}

void log_summary(const BatchSummary& summary, const fs::path& scenes_root) {
    SP_INFO("{}", kRule);
    SP_INFO(" All jobs finished - results are in {}", scenes_root.string());
    SP_INFO(" Completed: {}  Skipped: {}  Failed: {}  (total {})",
            summary.completed, summary.skipped, summary.failed, summary.total());

    for (const auto& outcome : summary.outcomes) {
        if (const auto* failed = std::get_if<FailedAtStage>(&outcome.status)) {
            SP_ERROR("   [FAIL] {} ({}): {}", outcome.video_name,
                     tools::stage_name(failed->stage), failed->error.message);
        } else if (const auto* completed = std::get_if<Completed>(&outcome.status);
                   completed && completed->model) {
            SP_INFO("   [DONE] {}: {}/{} frames registered, {} points", outcome.video_name,
                    completed->model->num_images, completed->model->num_frames,
                    completed->model->num_points3d);
        }
    }
    SP_INFO("{}", kRule);
}

}  // namespace sp::pipeline
