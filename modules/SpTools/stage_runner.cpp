/// @file stage_runner.cpp
#include "stage_runner.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sp::tools {

namespace {

/// @brief posix_spawn_file_actions_t 的 RAII 封装
class FileActions {
public:
    FileActions() { ok_ = ::posix_spawn_file_actions_init(&actions_) == 0; }
    ~FileActions() {
        if (ok_) ::posix_spawn_file_actions_destroy(&actions_);
    }
    FileActions(const FileActions&) = delete;
    FileActions& operator=(const FileActions&) = delete;

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] posix_spawn_file_actions_t* get() noexcept { return &actions_; }

    /// @brief stdout 打开到 path，stderr 复制 stdout
    [[nodiscard]] int redirect_output(const char* path, int flags) {
        int rc = ::posix_spawn_file_actions_addopen(&actions_, STDOUT_FILENO, path, flags, 0644);
        if (rc != 0) return rc;
        return ::posix_spawn_file_actions_adddup2(&actions_, STDOUT_FILENO, STDERR_FILENO);
    }

private:
    posix_spawn_file_actions_t actions_{};
    bool ok_ = false;
};

[[nodiscard]] StageResult launch_failure(Stage stage, const std::string& what, int err) {
    StageResult result;
    result.stage = stage;
    result.success = false;
    result.exit_code = -1;
    result.message = what + ": " + std::strerror(err);
    return result;
}

}  // namespace

std::string stage_name(Stage stage) {
    return core::enum_name_lower(stage);
}

std::string StageCommand::to_string() const {
    std::string out = executable.string();
    for (const auto& arg : arguments) {
        out += ' ';
        out += arg;
    }
    return out;
}

core::Error StageResult::to_error() const {
    if (success) {
        return {};
    }
    if (exit_code == -1) {
        return {core::ErrorCode::kLaunchFailure, message};
    }
    return {core::ErrorCode::kStageFailure,
            message.empty() ? stage_name(stage) + " exited with code " + std::to_string(exit_code)
                            : message};
}

ProcessStageRunner::ProcessStageRunner(ProcessEnvironment environment)
    : environment_(std::move(environment)) {}

StageResult ProcessStageRunner::run(const StageCommand& command, const StageContext& context) {
    SP_DEBUG("exec: {}", command.to_string());

    // argv / envp 的存储在 spawn 返回前必须保持有效
    const std::string exe = command.executable.string();
    std::vector<char*> argv;
    argv.reserve(command.arguments.size() + 2);
    argv.push_back(const_cast<char*>(exe.c_str()));
    for (const auto& arg : command.arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const std::vector<std::string> env_strings = environment_.to_envp();
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (const auto& entry : env_strings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    FileActions actions;
    if (!actions.ok()) {
        return launch_failure(command.stage, "posix_spawn_file_actions_init failed", ENOMEM);
    }

    const std::string log_file = context.log_file.string();
    switch (context.output) {
        case OutputMode::kInherit:
            break;
        case OutputMode::kDiscard:
            if (int rc = actions.redirect_output("/dev/null", O_WRONLY); rc != 0) {
                return launch_failure(command.stage, "cannot redirect output to /dev/null", rc);
            }
            break;
        case OutputMode::kFile:
            if (int rc = actions.redirect_output(log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND); rc != 0) {
                return launch_failure(command.stage, "cannot redirect output to " + log_file, rc);
            }
            break;
    }

    pid_t pid = -1;
    const int spawn_rc = ::posix_spawn(&pid, exe.c_str(), actions.get(), nullptr, argv.data(), envp.data());
    if (spawn_rc != 0) {
        return launch_failure(command.stage, "failed to launch " + exe, spawn_rc);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return launch_failure(command.stage, "waitpid failed for " + exe, errno);
        }
    }

    StageResult result;
    result.stage = command.stage;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.success = result.exit_code == 0;
        if (!result.success) {
            result.message = command.executable.filename().string() + " exited with code " +
                             std::to_string(result.exit_code);
        }
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.success = false;
        result.message = command.executable.filename().string() + " terminated by signal " +
                         std::to_string(WTERMSIG(status));
    } else {
        result.exit_code = status;
        result.success = false;
        result.message = "unexpected wait status " + std::to_string(status);
    }
    return result;
}

}  // namespace sp::tools
