#pragma once
/// @file stage_runner.hpp
/// @brief 单个外部阶段 (子进程) 的执行

#include "environment.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace sp::tools {

// ============================================================================
// 阶段
// ============================================================================
enum class Stage : uint8_t {
    Prepare = 0,  // 输入检查与目录创建 (无子进程)
    Extract,      // ffmpeg 抽帧
    Features,     // colmap feature_extractor
    Match,        // colmap sequential_matcher
    Mapper,       // colmap / glomap mapper
    Export,       // colmap model_converter
};

/// @brief 阶段名 (小写，用于日志)
[[nodiscard]] SPTOOLS_API std::string stage_name(Stage stage);

/// @brief 一次外部调用
struct StageCommand {
    Stage                    stage = Stage::Extract;
    std::filesystem::path    executable;
    std::vector<std::string> arguments;  // 不含 argv[0]

    /// 便于日志打印的命令行 (不做 shell 转义)
    [[nodiscard]] SPTOOLS_API std::string to_string() const;
};

/// @brief 子进程 stdout/stderr 去向
enum class OutputMode : uint8_t {
    kInherit = 0,  // 直接透传到终端，保留工具自身的进度输出
    kDiscard,      // 丢弃 (/dev/null)
    kFile,         // 追加写入 log_file
};

struct StageContext {
    OutputMode            output = OutputMode::kInherit;
    std::filesystem::path log_file;  // 仅 kFile 使用
};

struct StageResult {
    Stage       stage = Stage::Extract;
    bool        success = false;
    int         exit_code = -1;  // 被信号终止时为 128 + signo，无法启动时为 -1
    std::string message;

    [[nodiscard]] SPTOOLS_API core::Error to_error() const;
};

// ============================================================================
// 执行接口
// ============================================================================
class SPTOOLS_API StageRunner {
public:
    virtual ~StageRunner() = default;

    /// @brief 同步执行一个阶段，只检查退出码，不解析工具输出
    [[nodiscard]] virtual StageResult run(const StageCommand& command, const StageContext& context) = 0;
};

/// @brief 基于 posix_spawn 的实现
class SPTOOLS_API ProcessStageRunner final : public StageRunner {
public:
    explicit ProcessStageRunner(ProcessEnvironment environment);

    [[nodiscard]] StageResult run(const StageCommand& command, const StageContext& context) override;

    [[nodiscard]] const ProcessEnvironment& environment() const noexcept { return environment_; }

private:
    ProcessEnvironment environment_;
};

}  // namespace sp::tools
