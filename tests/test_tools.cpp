/// @file test_tools.cpp
/// @brief SpTools 单元测试
#include "SpTools.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace fs = std::filesystem;
using sp::test::TempDir;
using sp::test::write_file;
using sp::test::write_script;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ============================================================================
// 可执行文件查找
// ============================================================================

TEST(ToolLocator, EngineExecutable) {
    EXPECT_EQ(sp::tools::engine_executable(sp::tools::MapperEngine::Colmap), "colmap");
    EXPECT_EQ(sp::tools::engine_executable(sp::tools::MapperEngine::Glomap), "glomap");
}

TEST(ToolLocator, FindExecutableInDir) {
    TempDir tmp;
    const auto exe = write_script(tmp / "glomap", "exit 0");

    auto found = sp::tools::find_executable(tmp.path(), "glomap");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, exe);
}

TEST(ToolLocator, FindExecutableInBinSubdir) {
    TempDir tmp;
    const auto exe = write_script(tmp.path() / "bin" / "colmap", "exit 0");

    auto found = sp::tools::find_executable(tmp.path(), "colmap");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, exe);
}

TEST(ToolLocator, FindExecutableIgnoresNonExecutable) {
    TempDir tmp;
    write_file(tmp / "ffmpeg", "not a program");
    fs::permissions(tmp / "ffmpeg", fs::perms::owner_read | fs::perms::owner_write);
    fs::create_directories(tmp.path() / "bin" / "ffmpeg");  // 目录不算

    EXPECT_FALSE(sp::tools::find_executable(tmp.path(), "ffmpeg").has_value());
    EXPECT_FALSE(sp::tools::find_executable(tmp.path() / "missing", "ffmpeg").has_value());
}

TEST(ToolLocator, SplitSearchPath) {
    auto dirs = sp::tools::split_search_path("/usr/local/bin::/usr/bin:");
    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_EQ(dirs[0], fs::path("/usr/local/bin"));
    EXPECT_EQ(dirs[1], fs::path("/usr/bin"));

    EXPECT_TRUE(sp::tools::split_search_path("").empty());
}

// ============================================================================
// 工具定位顺序: 命令行 -> 安装目录 -> PATH
// ============================================================================

TEST(ToolLocator, ExplicitPathWins) {
    TempDir tmp;
    const auto explicit_exe = write_script(tmp.path() / "custom" / "my-glomap", "exit 0");
    write_script(tmp.path() / "install" / "glomap" / "glomap", "exit 0");

    sp::tools::ToolSearch search{"glomap", explicit_exe, tmp.path() / "install" / "glomap"};
    auto found = sp::tools::locate_tool(search, "");
    ASSERT_TRUE(found.has_value()) << found.error().message;
    EXPECT_EQ(*found, explicit_exe);
}

TEST(ToolLocator, ExplicitPathMissingIsError) {
    TempDir tmp;
    write_script(tmp.path() / "path" / "ffmpeg", "exit 0");

    sp::tools::ToolSearch search{"ffmpeg", tmp.path() / "nope" / "ffmpeg", {}};
    auto found = sp::tools::locate_tool(search, (tmp.path() / "path").string());
    ASSERT_FALSE(found.has_value());
    EXPECT_EQ(found.error().code, sp::core::ErrorCode::kToolNotFound);
    EXPECT_TRUE(contains(found.error().message, "nope"));
}

TEST(ToolLocator, InstallDirBeforePath) {
    TempDir tmp;
    const auto installed = write_script(tmp.path() / "install" / "colmap" / "bin" / "colmap", "exit 0");
    write_script(tmp.path() / "path" / "colmap", "exit 0");

    sp::tools::ToolSearch search{"colmap", std::nullopt, tmp.path() / "install" / "colmap"};
    auto found = sp::tools::locate_tool(search, (tmp.path() / "path").string());
    ASSERT_TRUE(found.has_value()) << found.error().message;
    EXPECT_EQ(*found, installed);
}

TEST(ToolLocator, FallsBackToPath) {
    TempDir tmp;
    const auto on_path = write_script(tmp.path() / "second" / "ffmpeg", "exit 0");
    fs::create_directories(tmp.path() / "first");

    const std::string path_env = (tmp.path() / "first").string() + ":" + (tmp.path() / "second").string();
    sp::tools::ToolSearch search{"ffmpeg", std::nullopt, tmp.path() / "install" / "ffmpeg"};
    auto found = sp::tools::locate_tool(search, path_env);
    ASSERT_TRUE(found.has_value()) << found.error().message;
    EXPECT_EQ(*found, on_path);
}

TEST(ToolLocator, NotFoundListsSearchedDirs) {
    TempDir tmp;
    sp::tools::ToolSearch search{"glomap", std::nullopt, tmp.path() / "install" / "glomap"};
    auto found = sp::tools::locate_tool(search, (tmp.path() / "path").string());
    ASSERT_FALSE(found.has_value());
    EXPECT_EQ(found.error().code, sp::core::ErrorCode::kToolNotFound);
    EXPECT_TRUE(contains(found.error().message, "glomap not found"));
    EXPECT_TRUE(contains(found.error().message, (tmp.path() / "install" / "glomap").string()));
    EXPECT_TRUE(contains(found.error().message, (tmp.path() / "path").string()));
}

TEST(ToolLocator, LocateToolsColmapEngine) {
    TempDir tmp;
    const auto ffmpeg = write_script(tmp.path() / "path" / "ffmpeg", "exit 0");
    const auto colmap = write_script(tmp.path() / "path" / "colmap", "exit 0");

    sp::tools::ToolLocatorOptions options;
    options.engine = sp::tools::MapperEngine::Colmap;
    options.install_root = tmp.path() / "install";
    options.path_env = (tmp.path() / "path").string();

    auto tools = sp::tools::locate_tools(options);
    ASSERT_TRUE(tools.has_value()) << tools.error().message;
    EXPECT_EQ(tools->ffmpeg, ffmpeg);
    EXPECT_EQ(tools->colmap, colmap);
    EXPECT_EQ(tools->mapper, colmap);
}

TEST(ToolLocator, LocateToolsGlomapNeedsColmap) {
    TempDir tmp;
    write_script(tmp.path() / "path" / "ffmpeg", "exit 0");
    const auto glomap = write_script(tmp.path() / "install" / "glomap" / "bin" / "glomap", "exit 0");

    sp::tools::ToolLocatorOptions options;
    options.engine = sp::tools::MapperEngine::Glomap;
    options.install_root = tmp.path() / "install";
    options.path_env = (tmp.path() / "path").string();

    auto missing = sp::tools::locate_tools(options);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, sp::core::ErrorCode::kToolNotFound);
    EXPECT_TRUE(contains(missing.error().message, "colmap"));

    const auto colmap = write_script(tmp.path() / "install" / "colmap" / "colmap", "exit 0");
    auto tools = sp::tools::locate_tools(options);
    ASSERT_TRUE(tools.has_value()) << tools.error().message;
    EXPECT_EQ(tools->mapper, glomap);
    EXPECT_EQ(tools->colmap, colmap);
}

TEST(ToolLocator, MissingFfmpegFailsFirst) {
    TempDir tmp;
    write_script(tmp.path() / "path" / "colmap", "exit 0");

    sp::tools::ToolLocatorOptions options;
    options.engine = sp::tools::MapperEngine::Colmap;
    options.install_root = tmp.path() / "install";
    options.path_env = (tmp.path() / "path").string();

    auto tools = sp::tools::locate_tools(options);
    ASSERT_FALSE(tools.has_value());
    EXPECT_TRUE(contains(tools.error().message, "ffmpeg"));
}

// ============================================================================
// 子进程环境
// ============================================================================

TEST(ProcessEnvironment, FromEnvp) {
    const char* envp[] = {"PATH=/usr/bin:/bin", "HOME=/home/user", "EMPTY=", "BROKEN", nullptr};
    auto env = sp::tools::ProcessEnvironment::from_envp(envp);

    EXPECT_EQ(env.get("PATH"), "/usr/bin:/bin");
    EXPECT_EQ(env.get("HOME"), "/home/user");
    EXPECT_TRUE(env.contains("EMPTY"));
    EXPECT_FALSE(env.contains("BROKEN"));
    EXPECT_EQ(env.to_envp().size(), 3u);
}

TEST(ProcessEnvironment, PrependPathsDeduplicates) {
    sp::tools::ProcessEnvironment env;
    env.set("PATH", "/usr/bin:/opt/colmap/bin");

    env.prepend_paths("PATH", {"/opt/colmap/bin", "/opt/glomap", "/opt/glomap"});
    EXPECT_EQ(env.get("PATH"), "/opt/colmap/bin:/opt/glomap:/usr/bin");
}

TEST(ProcessEnvironment, PrependToUnsetVariable) {
    sp::tools::ProcessEnvironment env;
    env.prepend_paths("QT_PLUGIN_PATH", {"/opt/colmap/plugins"});
    EXPECT_EQ(env.get("QT_PLUGIN_PATH"), "/opt/colmap/plugins");
}

TEST(ProcessEnvironment, MakeEnvironment) {
    TempDir tmp;
    fs::create_directories(tmp.path() / "colmap" / "plugins");

    sp::tools::ToolPaths tools;
    tools.ffmpeg = "/opt/ffmpeg/ffmpeg";
    tools.colmap = "/opt/colmap/bin/colmap";
    tools.mapper = "/opt/glomap/glomap";

    sp::tools::ProcessEnvironment base;
    base.set("PATH", "/usr/bin");
    base.set("LANG", "C.UTF-8");

    auto env = sp::tools::make_environment(tools, tmp.path(), base);
    const auto path = sp::tools::split_search_path(env.get("PATH"));

    ASSERT_FALSE(path.empty());
    EXPECT_EQ(path.front(), fs::path("/opt/ffmpeg"));
    EXPECT_EQ(path.back(), fs::path("/usr/bin"));
    EXPECT_NE(std::find(path.begin(), path.end(), fs::path("/opt/colmap/bin")), path.end());
    EXPECT_NE(std::find(path.begin(), path.end(), fs::path("/opt/glomap/bin")), path.end());
    EXPECT_EQ(env.get("QT_PLUGIN_PATH"), (tmp.path() / "colmap" / "plugins").string());
    EXPECT_EQ(env.get("LANG"), "C.UTF-8");
}

TEST(ProcessEnvironment, NoPluginDirNoQtPath) {
    TempDir tmp;
    sp::tools::ProcessEnvironment base;
    auto env = sp::tools::make_environment(sp::test::fake_tools(), tmp.path(), base);
    EXPECT_FALSE(env.contains("QT_PLUGIN_PATH"));
}

// ============================================================================
// ProcessStageRunner
// ============================================================================

namespace {

sp::tools::StageCommand script_command(const fs::path& script, std::vector<std::string> args = {}) {
    sp::tools::StageCommand cmd;
    cmd.stage = sp::tools::Stage::Features;
    cmd.executable = script;
    cmd.arguments = std::move(args);
    return cmd;
}

sp::tools::ProcessEnvironment minimal_environment() {
    sp::tools::ProcessEnvironment env;
    env.set("PATH", "/usr/bin:/bin");
    return env;
}

}  // namespace

TEST(ProcessStageRunner, StageName) {
    EXPECT_EQ(sp::tools::stage_name(sp::tools::Stage::Extract), "extract");
    EXPECT_EQ(sp::tools::stage_name(sp::tools::Stage::Mapper), "mapper");
}

TEST(ProcessStageRunner, CommandToString) {
    auto cmd = script_command("/opt/colmap/colmap", {"sequential_matcher", "--database_path", "db"});
    EXPECT_EQ(cmd.to_string(), "/opt/colmap/colmap sequential_matcher --database_path db");
}

TEST(ProcessStageRunner, ExitZeroIsSuccess) {
    TempDir tmp;
    const auto script = write_script(tmp / "ok.sh", "exit 0");

    sp::tools::ProcessStageRunner runner(minimal_environment());
    auto result = runner.run(script_command(script), {});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stage, sp::tools::Stage::Features);
    EXPECT_TRUE(result.to_error().ok());
}

TEST(ProcessStageRunner, NonZeroExitIsStageFailure) {
    TempDir tmp;
    const auto script = write_script(tmp / "fail.sh", "exit 3");

    sp::tools::ProcessStageRunner runner(minimal_environment());
    auto result = runner.run(script_command(script), {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.to_error().code, sp::core::ErrorCode::kStageFailure);
    EXPECT_TRUE(contains(result.message, "exited with code 3"));
}

TEST(ProcessStageRunner, KilledBySignal) {
    TempDir tmp;
    const auto script = write_script(tmp / "killed.sh", "kill -9 $$");

    sp::tools::ProcessStageRunner runner(minimal_environment());
    auto result = runner.run(script_command(script), {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 128 + 9);
    EXPECT_EQ(result.to_error().code, sp::core::ErrorCode::kStageFailure);
}

TEST(ProcessStageRunner, MissingExecutableIsLaunchFailure) {
    TempDir tmp;
    sp::tools::ProcessStageRunner runner(minimal_environment());
    auto result = runner.run(script_command(tmp / "does-not-exist"), {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(result.to_error().code, sp::core::ErrorCode::kLaunchFailure);
}

TEST(ProcessStageRunner, ArgumentsArePassedVerbatim) {
    TempDir tmp;
    const auto out = tmp / "args.txt";
    const auto script = write_script(tmp / "args.sh", "for a in \"$@\"; do echo \"$a\"; done > \"$1\"");

    sp::tools::ProcessStageRunner runner(minimal_environment());
    auto result = runner.run(script_command(script, {out.string(), "with space", "--flag"}), {});
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(sp::test::read_file(out), out.string() + "\nwith space\n--flag\n");
}

TEST(ProcessStageRunner, OutputCapturedToFile) {
    TempDir tmp;
    const auto script = write_script(tmp / "chatty.sh", "echo to-stdout\necho to-stderr 1>&2");
    const auto log = tmp / "features.log";

    sp::tools::ProcessStageRunner runner(minimal_environment());
    sp::tools::StageContext context;
    context.output = sp::tools::OutputMode::kFile;
    context.log_file = log;

    ASSERT_TRUE(runner.run(script_command(script), context).success);
    ASSERT_TRUE(runner.run(script_command(script), context).success);

    const auto text = sp::test::read_file(log);
    EXPECT_EQ(text, "to-stdout\nto-stderr\nto-stdout\nto-stderr\n");
}

TEST(ProcessStageRunner, OutputDiscarded) {
    TempDir tmp;
    const auto script = write_script(tmp / "chatty.sh", "echo noise\nexit 0");

    sp::tools::ProcessStageRunner runner(minimal_environment());
    sp::tools::StageContext context;
    context.output = sp::tools::OutputMode::kDiscard;
    auto result = runner.run(script_command(script), context);
    EXPECT_TRUE(result.success);
}

TEST(ProcessStageRunner, EnvironmentIsExplicit) {
    TempDir tmp;
    const auto out = tmp / "env.txt";
    const auto script = write_script(tmp / "env.sh",
        "echo \"$PATH\" > \"$1\"\necho \"$QT_PLUGIN_PATH\" >> \"$1\"");

    auto env = minimal_environment();
    env.prepend_paths("PATH", {"/opt/colmap/bin"});
    env.set("QT_PLUGIN_PATH", "/opt/colmap/plugins");

    sp::tools::ProcessStageRunner runner(env);
    ASSERT_TRUE(runner.run(script_command(script, {out.string()}), {}).success);
    EXPECT_EQ(sp::test::read_file(out), "/opt/colmap/bin:/usr/bin:/bin\n/opt/colmap/plugins\n");
}
