/// @file scene_layout.cpp
#include "scene_layout.hpp"
#include <cctype>

namespace sp::io {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

[[nodiscard]] bool is_image_file(const fs::path& path) {
    const auto ext = to_lower(path.extension().string());
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

[[nodiscard]] core::Error directory_error(const fs::path& path, const std::error_code& ec) {
    return {core::ErrorCode::kDirectoryCreation,
            "Failed to create " + path.string() + ": " + ec.message()};
}

}  // namespace

bool is_valid_scene_name(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string_view::npos && name.find('\\') == std::string_view::npos;
}

SceneLayout::SceneLayout(fs::path scenes_root) : scenes_root_(std::move(scenes_root)) {}

SceneDirectories SceneLayout::layout_for(std::string_view video_stem) const {
    SceneDirectories dirs;
    dirs.root     = scenes_root_ / std::string(video_stem);
    dirs.images   = dirs.root / "images";
    dirs.sparse   = dirs.root / "sparse";
    dirs.database = dirs.root / "database.db";
    dirs.logs     = dirs.root / "logs";
    return dirs;
}

bool SceneLayout::exists(const SceneDirectories& dirs) {
    std::error_code ec;
    return fs::exists(dirs.root, ec);
}

core::Result<void> SceneLayout::materialize(const SceneDirectories& dirs, bool clear_existing) {
    // root 必须是 scenes_root 下的普通子目录，否则 remove_all 可能删到 scenes_root 本身或其父目录
    const std::string name = dirs.root.filename().string();
    if (!is_valid_scene_name(name)) {
        return core::make_error(core::ErrorCode::kInvalidArgument,
            "Refusing to use " + dirs.root.string() + " as a scene directory");
    }

    std::error_code ec;

    if (clear_existing && fs::exists(dirs.root, ec)) {
        SP_INFO("Scene directory exists. Forcing overwrite: {}", dirs.root.string());
        fs::remove_all(dirs.root, ec);
        if (ec) {
            return core::make_error(core::ErrorCode::kDirectoryCreation,
                "Failed to clear " + dirs.root.string() + ": " + ec.message());
        }
    }

    for (const fs::path* dir : {&dirs.images, &dirs.sparse, &dirs.logs}) {
        fs::create_directories(*dir, ec);
        if (ec) {
            return core::unexpected(directory_error(*dir, ec));
        }
        // create_directories 对已存在的普通文件不报错
        if (!fs::is_directory(*dir, ec)) {
            return core::make_error(core::ErrorCode::kDirectoryCreation,
                "Not a directory: " + dir->string());
        }
    }
    return {};
}

size_t count_frames(const fs::path& images_dir) {
    std::error_code ec;
    if (!fs::is_directory(images_dir, ec)) {
        return 0;
    }

    size_t count = 0;
    for (fs::directory_iterator it(images_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !is_image_file(entry.path())) continue;
        if (entry.file_size(entry_ec) == 0 || entry_ec) continue;
        ++count;
    }
    return count;
}

}  // namespace sp::io
