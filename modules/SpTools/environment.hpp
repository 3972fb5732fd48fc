#pragma once
/// @file environment.hpp
/// @brief 子进程环境变量 (显式传递，不修改本进程环境)

#include "tool_locator.hpp"
#include <map>
#include <string>
#include <vector>

namespace sp::tools {

// ============================================================================
// 子进程环境
// ============================================================================
class SPTOOLS_API ProcessEnvironment {
public:
    ProcessEnvironment() = default;

    /// @brief 从 NAME=VALUE 形式的数组构造 (通常为 environ)
    static ProcessEnvironment from_envp(const char* const* envp);

    /// @brief 当前进程环境的快照
    static ProcessEnvironment current();

    [[nodiscard]] std::string get(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const;
    void set(const std::string& name, std::string value);

    /// @brief 将目录依次插入到列表型变量 (PATH 等) 最前面，已存在的目录不重复添加
    void prepend_paths(const std::string& name, const std::vector<std::filesystem::path>& dirs);

    /// @brief 生成 NAME=VALUE 列表，供 posix_spawn 使用
    [[nodiscard]] std::vector<std::string> to_envp() const;

private:
    std::map<std::string, std::string> vars_;
};

/// @brief 为已解析的工具构造子进程环境
/// - 每个工具所在目录及其 bin 子目录加到 PATH 最前面
/// - <install_root>/colmap/plugins 加到 QT_PLUGIN_PATH 最前面 (目录存在时)
[[nodiscard]] SPTOOLS_API ProcessEnvironment make_environment(
    const ToolPaths& tools,
    const std::filesystem::path& install_root,
    ProcessEnvironment base = ProcessEnvironment::current());

}  // namespace sp::tools
