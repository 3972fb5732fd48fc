/// @file inputs.cpp
#include "inputs.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace sp::io {

namespace fs = std::filesystem;

bool is_video_file(const fs::path& path) {
    std::string ext = path.extension().string();
    if (ext.empty()) {
        return false;
    }
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    static constexpr std::array<std::string_view, 6> kVideoExt = {
        ".mp4", ".mov", ".avi", ".mkv", ".m4v", ".webm"};
    return std::find(kVideoExt.begin(), kVideoExt.end(), ext) != kVideoExt.end();
}

std::vector<fs::path> expand_inputs(const std::vector<fs::path>& inputs) {
    std::vector<fs::path> videos;

    for (const auto& input : inputs) {
        std::error_code ec;
        if (!fs::is_directory(input, ec)) {
            videos.push_back(input);
            continue;
        }

        std::vector<fs::path> found;
        for (fs::directory_iterator it(input, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec) && is_video_file(it->path())) {
                found.push_back(it->path());
            }
        }
        if (ec) {
            SP_WARN("Failed to list {}: {}", input.string(), ec.message());
        }
        if (found.empty()) {
            SP_WARN("No video files in directory {}", input.string());
        }
        std::sort(found.begin(), found.end());
        videos.insert(videos.end(), found.begin(), found.end());
    }
    return videos;
}

}  // namespace sp::io
