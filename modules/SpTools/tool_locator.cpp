/// @file tool_locator.cpp
#include "tool_locator.hpp"
#include <cstdlib>
#include <unistd.h>

namespace sp::tools {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

[[nodiscard]] std::string join_dirs(const std::vector<fs::path>& dirs) {
    std::string out;
    for (const auto& dir : dirs) {
        if (!out.empty()) out += ", ";
        out += dir.string();
    }
    return out;
}

}  // namespace

std::string_view engine_executable(MapperEngine engine) noexcept {
    switch (engine) {
        case MapperEngine::Colmap: return "colmap";
        case MapperEngine::Glomap: return "glomap";
    }
    return "colmap";
}

std::optional<fs::path> find_executable(const fs::path& dir, std::string_view name) {
    const fs::path primary = dir / name;
    if (is_executable_file(primary)) {
        return primary;
    }
    const fs::path in_bin = dir / "bin" / name;
    if (is_executable_file(in_bin)) {
        return in_bin;
    }
    return std::nullopt;
}

std::vector<fs::path> split_search_path(std::string_view path_env) {
    std::vector<fs::path> dirs;
    size_t begin = 0;
    while (begin <= path_env.size()) {
        size_t end = path_env.find(':', begin);
        if (end == std::string_view::npos) end = path_env.size();
        if (end > begin) {
            dirs.emplace_back(std::string(path_env.substr(begin, end - begin)));
        }
        begin = end + 1;
    }
    return dirs;
}

core::Result<fs::path> locate_tool(const ToolSearch& search, std::string_view path_env) {
    if (search.explicit_path) {
        if (is_executable_file(*search.explicit_path)) {
            SP_DEBUG("Using {} from command line: {}", search.name, search.explicit_path->string());
            return *search.explicit_path;
        }
        return core::make_error(core::ErrorCode::kToolNotFound,
            "Provided path for " + search.name + " is not an executable: " +
            search.explicit_path->string());
    }

    std::vector<fs::path> searched;

    if (!search.install_dir.empty()) {
        if (auto found = find_executable(search.install_dir, search.name)) {
            SP_INFO("Found {} in {}: {}", search.name, search.install_dir.string(), found->string());
            return *found;
        }
        searched.push_back(search.install_dir);
        searched.push_back(search.install_dir / "bin");
    }

    for (const auto& dir : split_search_path(path_env)) {
        const fs::path candidate = dir / search.name;
        if (is_executable_file(candidate)) {
            SP_INFO("Found {} in PATH: {}", search.name, candidate.string());
            return candidate;
        }
        searched.push_back(dir);
    }

    return core::make_error(core::ErrorCode::kToolNotFound,
        search.name + " not found (searched: " + join_dirs(searched) + ")");
}

core::Result<ToolPaths> locate_tools(const ToolLocatorOptions& options) {
    ToolPaths tools;

    auto ffmpeg = locate_tool(
        {"ffmpeg", options.ffmpeg_path, options.install_root / "ffmpeg"}, options.path_env);
    if (!ffmpeg) {
        return core::unexpected(ffmpeg.error());
    }
    tools.ffmpeg = std::move(*ffmpeg);

    const std::string mapper_name(engine_executable(options.engine));
    auto mapper = locate_tool(
        {mapper_name, options.mapper_path, options.install_root / mapper_name}, options.path_env);
    if (!mapper) {
        return core::unexpected(mapper.error());
    }
    tools.mapper = std::move(*mapper);

    if (options.engine == MapperEngine::Colmap) {
        tools.colmap = tools.mapper;
        return tools;
    }

    SP_INFO("GLOMAP pipeline requires COLMAP for feature extraction, matching and export.");
    auto colmap = locate_tool(
        {"colmap", std::nullopt, options.install_root / "colmap"}, options.path_env);
    if (!colmap) {
        return core::unexpected(colmap.error());
    }
    tools.colmap = std::move(*colmap);
    return tools;
}

fs::path default_install_root() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "scenepipe";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".local" / "share" / "scenepipe";
    }
    return fs::path(".scenepipe");
}

}  // namespace sp::tools
