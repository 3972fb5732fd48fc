/// @file main.cpp
/// @brief scenepipe 命令行入口：视频 -> 稀疏重建场景

#include "SpPipeline.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace
{
	constexpr int kExitUsage = 2;

	struct CliArgs
	{
		std::vector<std::filesystem::path> inputs;
		sp::tools::MapperEngine engine = sp::tools::MapperEngine::Glomap;
		std::filesystem::path scenes_dir = "scenes";
		bool force = false;
		std::optional<std::filesystem::path> ffmpeg_path;
		std::optional<std::filesystem::path> tool_path;
		std::optional<std::filesystem::path> install_dir;
		size_t jobs = 1;
		sp::core::LogLevel log_level = sp::core::LogLevel::kInfo;
		bool show_help = false;
		bool show_version = false;
	};

	void print_usage(const char* prog)
	{
		std::cerr << "Usage: " << prog << " [options] <video|dir>...\n";
		std::cerr << "\n";
		std::cerr << "Converts videos into sparse photogrammetry scenes (ffmpeg + COLMAP/GLOMAP).\n";
		std::cerr << "\n";
		std::cerr << "Options:\n";
		std::cerr << "  -t, --tool <colmap|glomap>  Reconstruction engine for the mapping stage (default: glomap)\n";
		std::cerr << "      --scenes-dir <dir>      Output scenes directory (default: scenes)\n";
		std::cerr << "  -f, --force                 Re-process videos whose scene directory already exists\n";
		std::cerr << "      --ffmpeg-path <path>    Path to the ffmpeg executable\n";
		std::cerr << "      --tool-path <path>      Path to the colmap or glomap executable\n";
		std::cerr << "      --install-dir <dir>     Tool install root (default: $XDG_DATA_HOME/scenepipe)\n";
		std::cerr << "  -j, --jobs <n>              Number of videos processed in parallel (default: 1)\n";
		std::cerr << "      --log-level <level>     trace, debug, info, warn, error (default: info)\n";
		std::cerr << "  -h, --help                  Show this help\n";
		std::cerr << "  -v, --version               Print version information\n";
		std::cerr << "\n";
		std::cerr << "Output per video: <scenes-dir>/<name>/{images/, database.db, sparse/}\n";
		std::cerr << "Note: an existing scene directory counts as done, even if an earlier run\n";
		std::cerr << "      failed halfway. Use --force to rebuild it.\n";
		std::cerr << "      Videos whose names differ only in case (Clip.mp4, clip.mp4) share one\n";
		std::cerr << "      scene; only the first is processed.\n";
		std::cerr << "\n";
		std::cerr << "Example:\n";
		std::cerr << "  " << prog << " video.mp4 video.mov\n";
	}

	/// @brief 取选项的参数值；缺失时返回 nullopt
	std::optional<std::string> next_value(int& i, int argc, char* argv[])
	{
		if (i + 1 >= argc)
		{
			return std::nullopt;
		}
		return std::string(argv[++i]);
	}

	/// @brief 解析命令行，失败时返回错误信息
	sp::core::Result<CliArgs> parse_args(int argc, char* argv[])
	{
		CliArgs args;
		bool options_done = false;

		for (int i = 1; i < argc; ++i)
		{
			const std::string_view arg(argv[i]);
			if (options_done || arg.empty() || arg[0] != '-' || arg == "-")
			{
				args.inputs.emplace_back(argv[i]);
				continue;
			}
			if (arg == "--")
			{
				options_done = true;
				continue;
			}
			if (arg == "-h" || arg == "--help")
			{
				args.show_help = true;
				continue;
			}
			if (arg == "-v" || arg == "--version")
			{
				args.show_version = true;
				continue;
			}
			if (arg == "-f" || arg == "--force")
			{
				args.force = true;
				continue;
			}

			const auto value = next_value(i, argc, argv);
			if (!value)
			{
				return sp::core::make_error(sp::core::ErrorCode::kInvalidArgument,
					"Missing value after " + std::string(arg));
			}

			if (arg == "-t" || arg == "--tool")
			{
				const auto engine = sp::core::enum_cast_icase<sp::tools::MapperEngine>(*value);
				if (!engine)
				{
					return sp::core::make_error(sp::core::ErrorCode::kInvalidArgument,
						"Unknown tool '" + *value + "' (expected colmap or glomap)");
				}
				args.engine = *engine;
			}
			else if (arg == "--scenes-dir")
			{
				args.scenes_dir = *value;
			}
			else if (arg == "--ffmpeg-path")
			{
				args.ffmpeg_path = std::filesystem::path(*value);
			}
			else if (arg == "--tool-path")
			{
				args.tool_path = std::filesystem::path(*value);
			}
			else if (arg == "--install-dir")
			{
				args.install_dir = std::filesystem::path(*value);
			}
			else if (arg == "-j" || arg == "--jobs")
			{
				char* end = nullptr;
				const long jobs = std::strtol(value->c_str(), &end, 10);
				if (end == value->c_str() || *end != '\0' || jobs < 1)
				{
					return sp::core::make_error(sp::core::ErrorCode::kInvalidArgument,
						"Invalid job count '" + *value + "'");
				}
				args.jobs = static_cast<size_t>(jobs);
			}
			else if (arg == "--log-level")
			{
				const auto level = sp::core::log_level_from_string(*value);
				if (!level)
				{
					return sp::core::make_error(sp::core::ErrorCode::kInvalidArgument,
						"Unknown log level '" + *value + "'");
				}
				args.log_level = *level;
			}
			else
			{
				return sp::core::make_error(sp::core::ErrorCode::kInvalidArgument,
					"Unknown option " + std::string(arg));
			}
		}
		return args;
	}
} // namespace

int main(int argc, char* argv[])
{
	auto parsed = parse_args(argc, argv);
	if (!parsed.has_value())
	{
		std::cerr << "Error: " << parsed.error().message << "\n\n";
		print_usage(argv[0]);
		return kExitUsage;
	}
	const CliArgs& args = *parsed;

	if (args.show_help)
	{
		print_usage(argv[0]);
		return 0;
	}
	if (args.show_version)
	{
		std::cout << "scenepipe v" << sp::core::version() << "\n";
		return 0;
	}
	if (args.inputs.empty())
	{
		print_usage(argv[0]);
		return kExitUsage;
	}

	sp::core::Log::init("scenepipe", args.log_level);

	const auto videos = sp::io::expand_inputs(args.inputs);
	if (videos.empty())
	{
		SP_CRITICAL("No input videos found");
		return 1;
	}

	// 工具在处理任何视频之前全部解析，缺一个就整体失败
	sp::tools::ToolLocatorOptions locator;
	locator.engine = args.engine;
	locator.install_root = args.install_dir.value_or(sp::tools::default_install_root());
	locator.ffmpeg_path = args.ffmpeg_path;
	locator.mapper_path = args.tool_path;
	if (const char* path_env = std::getenv("PATH"))
	{
		locator.path_env = path_env;
	}

	auto tools = sp::tools::locate_tools(locator);
	if (!tools.has_value())
	{
		SP_CRITICAL("{}", tools.error().message);
		SP_CRITICAL("Install the missing tool, add it to PATH, or place it under {}",
		            locator.install_root.string());
		return 1;
	}

	sp::tools::ProcessStageRunner runner(
		sp::tools::make_environment(*tools, locator.install_root));

	std::error_code ec;
	std::filesystem::create_directories(args.scenes_dir, ec);
	if (ec)
	{
		SP_CRITICAL("Failed to create scenes directory {}: {}", args.scenes_dir.string(), ec.message());
		return 1;
	}

	sp::pipeline::BatchOptions options;
	options.scenes_root = args.scenes_dir;
	options.engine = args.engine;
	options.force = args.force;
	options.jobs = args.jobs;

	const auto summary = sp::pipeline::run_batch(videos, options, *tools, runner);
	sp::pipeline::log_summary(summary, options.scenes_root);

	if (summary.all_failed())
	{
		SP_ERROR("Every video failed");
	}
	return summary.exit_code();
}
