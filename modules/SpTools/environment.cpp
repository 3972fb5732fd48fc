/// @file environment.cpp
#include "environment.hpp"
#include <algorithm>

extern char** environ;

namespace sp::tools {

namespace fs = std::filesystem;

ProcessEnvironment ProcessEnvironment::from_envp(const char* const* envp) {
    ProcessEnvironment env;
    if (!envp) {
        return env;
    }
    for (const char* const* it = envp; *it; ++it) {
        const std::string_view entry(*it);
        const auto eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0) continue;
        env.vars_[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));
    }
    return env;
}

ProcessEnvironment ProcessEnvironment::current() {
    return from_envp(environ);
}

std::string ProcessEnvironment::get(const std::string& name) const {
    auto it = vars_.find(name);
    return it == vars_.end() ? std::string() : it->second;
}

bool ProcessEnvironment::contains(const std::string& name) const {
    return vars_.count(name) > 0;
}

void ProcessEnvironment::set(const std::string& name, std::string value) {
    vars_[name] = std::move(value);
}

void ProcessEnvironment::prepend_paths(const std::string& name, const std::vector<fs::path>& dirs) {
    std::vector<fs::path> existing = split_search_path(get(name));

    std::vector<fs::path> merged;
    merged.reserve(dirs.size() + existing.size());
    for (const auto& dir : dirs) {
        if (dir.empty()) continue;
        if (std::find(merged.begin(), merged.end(), dir) != merged.end()) continue;
        merged.push_back(dir);
    }
    for (const auto& dir : existing) {
        if (std::find(merged.begin(), merged.end(), dir) != merged.end()) continue;
        merged.push_back(dir);
    }

    std::string value;
    for (const auto& dir : merged) {
        if (!value.empty()) value += ':';
        value += dir.string();
    }
    vars_[name] = std::move(value);
}

std::vector<std::string> ProcessEnvironment::to_envp() const {
    std::vector<std::string> out;
    out.reserve(vars_.size());
    for (const auto& [name, value] : vars_) {
        out.push_back(name + "=" + value);
    }
    return out;
}

ProcessEnvironment make_environment(
    const ToolPaths& tools, const fs::path& install_root, ProcessEnvironment base) {
    std::vector<fs::path> dirs;
    for (const fs::path* tool : {&tools.ffmpeg, &tools.colmap, &tools.mapper}) {
        if (tool->empty()) continue;
        const fs::path dir = tool->parent_path();
        dirs.push_back(dir);
        dirs.push_back(dir / "bin");
    }
    base.prepend_paths("PATH", dirs);

    std::error_code ec;
    const fs::path plugins = install_root / "colmap" / "plugins";
    if (!install_root.empty() && fs::is_directory(plugins, ec)) {
        base.prepend_paths("QT_PLUGIN_PATH", {plugins});
    }

    SP_DEBUG("Subprocess PATH: {}", base.get("PATH"));
    return base;
}

}  // namespace sp::tools
