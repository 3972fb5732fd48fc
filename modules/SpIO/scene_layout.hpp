#pragma once
/// @file scene_layout.hpp
/// @brief 单个视频的输出目录结构

#if defined(_WIN32)
  #ifdef SPIO_EXPORTS
    #define SPIO_API __declspec(dllexport)
  #else
    #define SPIO_API __declspec(dllimport)
  #endif
#else
  #define SPIO_API __attribute__((visibility("default")))
#endif

#include "SpCore.hpp"
#include <filesystem>

namespace sp::io {

// ============================================================================
// 场景目录
// ============================================================================
struct SceneDirectories {
    std::filesystem::path root;      // <scenes>/<stem>，存在即视为已处理
    std::filesystem::path images;    // root/images，frame_000001.jpg ...
    std::filesystem::path sparse;    // root/sparse，mapper 输出及 TXT 导出
    std::filesystem::path database;  // root/database.db
    std::filesystem::path logs;      // root/logs，并行模式下的工具输出

    /// 主模型目录 (sparse/0)
    [[nodiscard]] std::filesystem::path primary_model() const { return sparse / "0"; }
};

/// @brief 视频 stem 能否作为 scenes_root 的直接子目录名
/// 拒绝空串、"."、".." 和含路径分隔符的名字 ("...mp4" 的 stem 为 "..")
[[nodiscard]] SPIO_API bool is_valid_scene_name(std::string_view name) noexcept;

// ============================================================================
// 目录布局
// ============================================================================
class SPIO_API SceneLayout {
public:
    explicit SceneLayout(std::filesystem::path scenes_root);

    [[nodiscard]] const std::filesystem::path& scenes_root() const noexcept { return scenes_root_; }

    /// @brief 由视频文件名 (stem) 计算目录，纯函数
    [[nodiscard]] SceneDirectories layout_for(std::string_view video_stem) const;

    /// @brief 仅检查场景根目录是否存在
    [[nodiscard]] static bool exists(const SceneDirectories& dirs);

    /// @brief 创建 images / sparse / logs 子目录
    /// @param clear_existing 为 true 时先删除整个场景根目录 (强制重跑)
    /// @return 根目录名非法时返回 kInvalidArgument (不删除任何东西)，创建失败返回 kDirectoryCreation
    [[nodiscard]] static core::Result<void> materialize(const SceneDirectories& dirs, bool clear_existing);

private:
    std::filesystem::path scenes_root_;
};

/// @brief 统计目录下非空的图像文件 (.jpg/.jpeg/.png) 数量，目录不存在返回 0
[[nodiscard]] SPIO_API size_t count_frames(const std::filesystem::path& images_dir);

}  // namespace sp::io
