#pragma once
/// @file tool_locator.hpp
/// @brief 外部工具 (ffmpeg / colmap / glomap) 定位

#if defined(_WIN32)
  #ifdef SPTOOLS_EXPORTS
    #define SPTOOLS_API __declspec(dllexport)
  #else
    #define SPTOOLS_API __declspec(dllimport)
  #endif
#else
  #define SPTOOLS_API __attribute__((visibility("default")))
#endif

#include "SpCore.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sp::tools {

// ============================================================================
// 重建引擎
// ============================================================================
enum class MapperEngine : uint8_t {
    Colmap = 0,  // 增量式 SfM
    Glomap,      // 全局式 SfM，特征/匹配/格式转换仍依赖 colmap
};

/// @brief 引擎对应的可执行文件名
[[nodiscard]] SPTOOLS_API std::string_view engine_executable(MapperEngine engine) noexcept;

// ============================================================================
// 查找参数
// ============================================================================
struct ToolSearch {
    std::string                          name;           // 可执行文件名 (不含扩展名)
    std::optional<std::filesystem::path> explicit_path;  // 命令行指定，优先级最高
    std::filesystem::path                install_dir;    // <install_root>/<name>
};

struct ToolLocatorOptions {
    MapperEngine                         engine = MapperEngine::Glomap;
    std::filesystem::path                install_root;
    std::optional<std::filesystem::path> ffmpeg_path;
    std::optional<std::filesystem::path> mapper_path;  // --tool-path
    std::string                          path_env;     // 进程 PATH 的快照
};

/// @brief 已解析的工具路径
struct ToolPaths {
    std::filesystem::path ffmpeg;
    std::filesystem::path colmap;   // 特征提取 / 匹配 / 模型转换
    std::filesystem::path mapper;   // colmap 或 glomap
};

// ============================================================================
// 查找函数
// ============================================================================

/// @brief 在 dir 及 dir/bin 下查找可执行文件
/// @return 找到的路径，未找到返回 nullopt
[[nodiscard]] SPTOOLS_API std::optional<std::filesystem::path> find_executable(
    const std::filesystem::path& dir, std::string_view name);

/// @brief 拆分 PATH 字符串 (':' 分隔，忽略空项)
[[nodiscard]] SPTOOLS_API std::vector<std::filesystem::path> split_search_path(
    std::string_view path_env);

/// @brief 定位单个工具
/// 顺序: explicit_path -> install_dir, install_dir/bin -> PATH 中各目录
[[nodiscard]] SPTOOLS_API core::Result<std::filesystem::path> locate_tool(
    const ToolSearch& search, std::string_view path_env);

/// @brief 定位所选引擎需要的全部工具；任一缺失返回 kToolNotFound
[[nodiscard]] SPTOOLS_API core::Result<ToolPaths> locate_tools(
    const ToolLocatorOptions& options);

/// @brief 默认安装根目录: $XDG_DATA_HOME/scenepipe 或 $HOME/.local/share/scenepipe
[[nodiscard]] SPTOOLS_API std::filesystem::path default_install_root();

}  // namespace sp::tools
