/// @file model_summary.cpp
#include "model_summary.hpp"
#include <cctype>
#include <fstream>
#include <string>

namespace sp::io {

namespace fs = std::filesystem;

namespace {

// ============================================================================
// 辅助函数
// ============================================================================

[[nodiscard]] core::Error file_not_found_error(const fs::path& path) {
    return {core::ErrorCode::kFileNotFound, "File not found: " + path.string()};
}

[[nodiscard]] core::Error parse_error(const std::string& msg) {
    return {core::ErrorCode::kParseError, msg};
}

/// @brief 判断行是否为注释或空行
[[nodiscard]] bool is_comment_or_empty(const std::string& line) {
    if (line.empty()) return true;
    for (char c : line) {
        if (c == '#') return true;
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

/// @brief 小端序读取
template <typename T>
[[nodiscard]] bool read_binary(std::istream& is, T& value) {
    return static_cast<bool>(is.read(reinterpret_cast<char*>(&value), sizeof(T)));
}

/// @brief 读取 *.bin 文件头的 uint64 元素数量
[[nodiscard]] core::Result<uint64_t> read_binary_count(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return core::unexpected(file_not_found_error(path));
    }
    uint64_t count = 0;
    if (!read_binary(file, count)) {
        return core::unexpected(parse_error("Failed to read element count: " + path.string()));
    }
    return count;
}

/// @brief 统计 cameras.txt / points3D.txt 中的记录行
[[nodiscard]] core::Result<uint64_t> count_text_records(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return core::unexpected(file_not_found_error(path));
    }
    uint64_t count = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (!is_comment_or_empty(line)) ++count;
    }
    return count;
}

/// @brief 统计 images.txt 中的图像，每个图像占两行，第二行 (POINTS2D) 可能为空
[[nodiscard]] core::Result<uint64_t> count_text_images(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return core::unexpected(file_not_found_error(path));
    }
    uint64_t count = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (is_comment_or_empty(line)) continue;
        ++count;
        if (!std::getline(file, line)) {
            return core::unexpected(parse_error(
                "Missing points2d line for image record " + std::to_string(count)));
        }
    }
    return count;
}

}  // namespace

// ============================================================================
// 公共 API 实现
// ============================================================================

core::Result<ModelSummary> read_model_summary_binary(const fs::path& model_dir) {
    auto cameras = read_binary_count(model_dir / "cameras.bin");
    if (!cameras) {
        return core::unexpected(cameras.error());
    }
    auto images = read_binary_count(model_dir / "images.bin");
    if (!images) {
        return core::unexpected(images.error());
    }
    auto points3d = read_binary_count(model_dir / "points3D.bin");
    if (!points3d) {
        return core::unexpected(points3d.error());
    }

    ModelSummary summary;
    summary.format       = ModelFormat::Binary;
    summary.num_cameras  = *cameras;
    summary.num_images   = *images;
    summary.num_points3d = *points3d;
    return summary;
}

core::Result<ModelSummary> read_model_summary_text(const fs::path& model_dir) {
    auto cameras = count_text_records(model_dir / "cameras.txt");
    if (!cameras) {
        return core::unexpected(cameras.error());
    }
    auto images = count_text_images(model_dir / "images.txt");
    if (!images) {
        return core::unexpected(images.error());
    }
    auto points3d = count_text_records(model_dir / "points3D.txt");
    if (!points3d) {
        return core::unexpected(points3d.error());
    }

    ModelSummary summary;
    summary.format       = ModelFormat::Text;
    summary.num_cameras  = *cameras;
    summary.num_images   = *images;
    summary.num_points3d = *points3d;
    return summary;
}

core::Result<ModelSummary> read_model_summary(const fs::path& model_dir) {
    std::error_code ec;

    // 优先尝试 binary 格式
    if (fs::exists(model_dir / "cameras.bin", ec) &&
        fs::exists(model_dir / "images.bin", ec) &&
        fs::exists(model_dir / "points3D.bin", ec)) {
        return read_model_summary_binary(model_dir);
    }

    // 回退到 text 格式
    if (fs::exists(model_dir / "cameras.txt", ec) &&
        fs::exists(model_dir / "images.txt", ec) &&
        fs::exists(model_dir / "points3D.txt", ec)) {
        return read_model_summary_text(model_dir);
    }

    return core::make_error(core::ErrorCode::kFileNotFound,
        "No valid COLMAP model found in: " + model_dir.string());
}

}  // namespace sp::io
