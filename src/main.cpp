#include "audio/FFmpegAudioAnalyzer.h"
#include "edit/EditPlanBuilder.h"
#include "edit/PlanExecutor.h"
#include "job/JobParser.h"
#include "job/JobReport.h"
#include "media/FFmpegMediaOperations.h"
#include "utils/Logger.h"
#include "utils/Timer.h"

extern "C" {
#include <libavformat/avformat.h>
}

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>


void printUsage(const char* programName) {
	std::cout << "Usage: " << programName << " <job_file> <output_file> [options]\n";
	std::cout << "\nOptions:\n";
	std::cout << "  -s, --strategy <name>        Distribution strategy (rhythm, energy, even)\n";
	std::cout << "  --min-clip <seconds>         Minimum clip duration (0.5 - 10)\n";
	std::cout << "  --target-duration <seconds>  Cap the edit below the audio length\n";
	std::cout << "  -t, --transition <type>      Transition (none, fade, dissolve, wipe, slide)\n";
	std::cout << "  --transition-duration <s>    Transition duration (0 - 2)\n";
	std::cout << "  --seed <value>               Random seed for reproducible plans\n";
	std::cout << "  --scratch-dir <dir>          Directory for intermediate files\n";
	std::cout << "  --ffmpeg <path>              ffmpeg binary (default: $BEATCUT_FFMPEG or ffmpeg)\n";
	std::cout << "  --crf <value>                Constant Rate Factor for re-encoded clips (default: 23)\n";
	std::cout << "  -p, --preset <preset>        Encoder preset (default: veryfast)\n";
	std::cout << "  -r, --report <file>          Write the plan and result as JSON\n";
	std::cout << "  --plan-only                  Print the plan as JSON and exit without rendering\n";
	std::cout << "  -v, --verbose                Enable verbose logging\n";
	std::cout << "  -q, --quiet                  Suppress all non-error output\n";
	std::cout << "  -h, --help                   Show this help message\n";
	std::cout << "\nEnvironment:\n";
	std::cout << "  BEATCUT_LOG_LEVEL            error, warn, info or debug\n";
	std::cout << "  BEATCUT_FFMPEG               ffmpeg binary\n";
	std::cout << "  BEATCUT_SCRATCH_DIR          Directory for intermediate files\n";
	std::cout << "\nExamples:\n";
	std::cout << "  " << programName << " job.json output.mp4\n";
	std::cout << "  " << programName << " job.json output.mp4 --strategy energy --transition dissolve\n";
	std::cout << "  " << programName << " job.json output.mp4 --seed 42 --plan-only\n";
}

struct Options {
	std::string jobFile;
	std::string outputFile;
	std::optional<std::string> strategy;
	std::optional<double> minClipDuration;
	std::optional<double> targetDuration;
	std::optional<std::string> transition;
	std::optional<double> transitionDuration;
	std::optional<uint32_t> seed;
	std::optional<std::string> scratchDir;
	std::optional<std::string> ffmpegPath;
	int crf = 23;
	std::string preset = "veryfast";
	std::string reportFile;
	bool planOnly = false;
	bool verbose = false;
	bool quiet = false;
};

template<typename T, typename Convert>
T parseNumber(const std::string& name, const char* value, Convert convert) {
	try {
		return convert(value);
	} catch (const std::invalid_argument&) {
		std::cerr << "Error: Invalid " << name << " value: " << value << "\n";
		std::exit(1);
	} catch (const std::out_of_range&) {
		std::cerr << "Error: " << name << " value out of range: " << value << "\n";
		std::exit(1);
	}
}

Options parseCommandLine(int argc, char* argv[]) {
	Options opts;

	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		if (arg == "-h" || arg == "--help") {
			printUsage(argv[0]);
			std::exit(0);
		}
	}

	if (argc < 3) {
		printUsage(argv[0]);
		std::exit(1);
	}

	opts.jobFile = argv[1];
	opts.outputFile = argv[2];

	auto toDouble = [](const char* s) { return std::stod(s); };
	auto toInt = [](const char* s) { return std::stoi(s); };

	for (int i = 3; i < argc; ++i) {
		std::string arg = argv[i];

		if (arg == "-v" || arg == "--verbose") {
			opts.verbose = true;
		} else if (arg == "-q" || arg == "--quiet") {
			opts.quiet = true;
		} else if (arg == "--plan-only") {
			opts.planOnly = true;
		} else if ((arg == "-s" || arg == "--strategy") && i + 1 < argc) {
			opts.strategy = argv[++i];
		} else if (arg == "--min-clip" && i + 1 < argc) {
			opts.minClipDuration = parseNumber<double>("min-clip", argv[++i], toDouble);
		} else if (arg == "--target-duration" && i + 1 < argc) {
			opts.targetDuration = parseNumber<double>("target-duration", argv[++i], toDouble);
		} else if ((arg == "-t" || arg == "--transition") && i + 1 < argc) {
			opts.transition = argv[++i];
		} else if (arg == "--transition-duration" && i + 1 < argc) {
			opts.transitionDuration = parseNumber<double>("transition-duration", argv[++i], toDouble);
		} else if (arg == "--seed" && i + 1 < argc) {
			// stoull wraps "-1" instead of rejecting it
			const char* value = argv[++i];
			unsigned long long seed = parseNumber<unsigned long long>("seed", value,
				[](const char* s) { return std::stoull(s); });
			if (value[0] == '-' || seed > std::numeric_limits<uint32_t>::max()) {
				std::cerr << "Error: seed must be between 0 and " << std::numeric_limits<uint32_t>::max() << "\n";
				std::exit(1);
			}
			opts.seed = static_cast<uint32_t>(seed);
		} else if (arg == "--scratch-dir" && i + 1 < argc) {
			opts.scratchDir = argv[++i];
		} else if (arg == "--ffmpeg" && i + 1 < argc) {
			opts.ffmpegPath = argv[++i];
		} else if (arg == "--crf" && i + 1 < argc) {
			opts.crf = parseNumber<int>("CRF", argv[++i], toInt);
		} else if ((arg == "-p" || arg == "--preset") && i + 1 < argc) {
			opts.preset = argv[++i];
		} else if ((arg == "-r" || arg == "--report") && i + 1 < argc) {
			opts.reportFile = argv[++i];
		} else {
			std::cerr << "Unknown option: " << arg << "\n";
			printUsage(argv[0]);
			std::exit(1);
		}
	}

	return opts;
}

std::string getEnv(const char* name) {
	const char* value = std::getenv(name);
	return value ? value : "";
}

// Command-line values win over the job file
void applyOverrides(job::Job& job, const Options& opts) {
	if (opts.strategy) {
		if (!edit::isKnownStrategyName(*opts.strategy)) {
			utils::Logger::warn("Unknown strategy '{}', falling back to even", *opts.strategy);
		}
		job.strategy = *opts.strategy;
	}
	if (opts.minClipDuration) {
		job.minClipDuration = *opts.minClipDuration;
	}
	if (opts.targetDuration) {
		job.targetDuration = opts.targetDuration;
	}
	if (opts.transition) {
		if (!media::isKnownTransitionName(*opts.transition)) {
			throw job::InvalidJobException("transition must be one of none, fade, dissolve, wipe, slide: " +
				*opts.transition);
		}
		job.transition.type = media::stringToTransitionType(*opts.transition);
	}
	if (opts.transitionDuration) {
		job.transition.duration = *opts.transitionDuration;
	}
	if (opts.seed) {
		job.seed = opts.seed;
	}
	if (opts.scratchDir) {
		job.scratchDir = *opts.scratchDir;
	}
	job::JobParser::validate(job);
}

int main(int argc, char* argv[]) {
	Options opts = parseCommandLine(argc, argv);

	// Set logging level
	if (opts.quiet) {
		utils::Logger::setLevel(utils::Logger::ERROR);
	} else if (opts.verbose) {
		utils::Logger::setLevel(utils::Logger::DEBUG);
	} else {
		utils::Logger::setLevel(utils::Logger::levelFromString(getEnv("BEATCUT_LOG_LEVEL"), utils::Logger::INFO));
	}

	try {
		TIME_BLOCK("main_total");

		// Initialize FFmpeg (required for older versions)
#if LIBAVFORMAT_VERSION_INT < AV_VERSION_INT(58, 9, 100)
		av_register_all();
#endif

		job::Job job;
		{
			TIME_BLOCK("job_parsing");
			utils::Logger::info("Parsing job file: {}", opts.jobFile);
			job = job::JobParser::parse(opts.jobFile);
			applyOverrides(job, opts);
		}

		if (job.scratchDir.empty()) {
			job.scratchDir = getEnv("BEATCUT_SCRATCH_DIR");
		}

		uint32_t seed = job.seed ? *job.seed : std::random_device{}();
		utils::Logger::info("Job: {} clips, audio {}, strategy {}, seed {}",
			job.clips.size(), job.audio, job.strategy, seed);

		media::FFmpegMediaOperations::Config mediaConfig;
		if (opts.ffmpegPath) {
			mediaConfig.ffmpegPath = *opts.ffmpegPath;
		} else if (!getEnv("BEATCUT_FFMPEG").empty()) {
			mediaConfig.ffmpegPath = getEnv("BEATCUT_FFMPEG");
		}
		mediaConfig.crf = opts.crf;
		mediaConfig.preset = opts.preset;
		mediaConfig.width = job.video.width;
		mediaConfig.height = job.video.height;
		mediaConfig.fps = job.video.fps;

		media::FFmpegMediaOperations mediaOps(mediaConfig);
		audio::FFmpegAudioAnalyzer analyzer;

		edit::EditPlanBuilder builder(mediaOps, analyzer, seed, job.segmentCount);
		edit::EditPlan plan = builder.build(job.clips, job.audio, job.strategy, job.minClipDuration,
			job.targetDuration);

		if (opts.planOnly) {
			std::cout << job::JobReport::planToJson(plan).dump(2) << std::endl;
			if (!opts.reportFile.empty()) {
				job::JobReport::write(opts.reportFile, job::JobReport::toJson(plan, nullptr));
			}
			return 0;
		}

		edit::PlanExecutor::Config executorConfig;
		executorConfig.scratchRoot = job.scratchDir;
		edit::PlanExecutor executor(mediaOps, executorConfig);

		utils::Logger::info("Rendering {} with {} transition", opts.outputFile,
			media::transitionTypeToString(job.transition.type));
		edit::ExecutionResult result = executor.execute(plan, opts.outputFile, job.transition);

		if (!opts.reportFile.empty()) {
			job::JobReport::write(opts.reportFile, job::JobReport::toJson(plan, &result));
			utils::Logger::info("Report written to {}", opts.reportFile);
		}

		utils::Logger::info("Edit complete!");
		utils::Logger::info("Clips used: {}", result.clipsUsed);
		utils::Logger::info("Duration: {} seconds", result.duration);
		if (result.transitionFallbacks > 0) {
			utils::Logger::info("Transition fallbacks: {}", result.transitionFallbacks);
		}
		utils::Logger::info("Output file: {}", result.outputPath);

		// Print timing report if verbose mode is enabled
		if (opts.verbose) {
			utils::Timer::getInstance().printReport();
		}

		return 0;

	} catch (const edit::EditException& e) {
		utils::Logger::error("Fatal error during {}: {}", e.stage(), e.what());
		return 1;
	} catch (const std::exception& e) {
		utils::Logger::error("Fatal error: {}", e.what());
		return 1;
	}
}
