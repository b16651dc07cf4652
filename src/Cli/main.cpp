/*
 * Privacy Guard - Command Line Tool
 * Copyright (C) 2025 Privacy Guard contributors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; for more details see the file
 * "LICENSE.GPL-3.0-or-later" in the distribution root.
 */

#include <charconv>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include <PrivacyGuard/Batch/BatchProcessor.hpp>
#include <PrivacyGuard/Batch/OutputPathPlanner.hpp>
#include <PrivacyGuard/Core/RedactorConfig.hpp>
#include <PrivacyGuard/Core/Types.hpp>
#include <PrivacyGuard/Detection/DetectionEngine.hpp>
#include <PrivacyGuard/Detection/ModelRegistry.hpp>
#include <PrivacyGuard/Logger/ConsoleLogger.hpp>
#include <PrivacyGuard/Redaction/RegionTransformer.hpp>

using namespace PrivacyGuard;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitPartial = 2;

struct CliOptions {
	Core::DetectionOptions detection;
	std::optional<Core::OutputFormat> format;
	std::filesystem::path outDir = ".";
	bool verbose = false;
	std::vector<std::filesystem::path> inputs;
};

void printUsage()
{
	fmt::print(stderr,
		   "Usage: privacy-guard [options] IMG [IMG...]\n"
		   "  --mode gaussian|pixelation|emoji   redaction style (default gaussian)\n"
		   "  --intensity N                      0-100 (default 80)\n"
		   "  --sensitivity N                    0-100 (default 60)\n"
		   "  --no-faces                         skip face detection\n"
		   "  --no-plates                        skip license plate detection\n"
		   "  --emoji KEY                        smile|cool|monkey|robot|star|heart|lock\n"
		   "  --format png|jpeg|webp             output format\n"
		   "  --out-dir DIR                      output directory (default .)\n"
		   "  --verbose                          debug logging\n");
}

std::optional<int> parseInt(std::string_view text)
{
	int value = 0;
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc() || ptr != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

std::optional<CliOptions> parseArgs(int argc, char **argv)
{
	CliOptions options;

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		const auto next = [&]() -> std::optional<std::string_view> {
			if (i + 1 >= argc) {
				fmt::print(stderr, "Missing value for {}\n", arg);
				return std::nullopt;
			}
			return std::string_view(argv[++i]);
		};

		if (arg == "--no-faces") {
			options.detection.detectFaces = false;
		} else if (arg == "--no-plates") {
			options.detection.detectPlates = false;
		} else if (arg == "--verbose") {
			options.verbose = true;
		} else if (arg == "--mode") {
			const auto value = next();
			const auto mode = value ? Core::parseBlurMode(*value) : std::nullopt;
			if (!mode) {
				return std::nullopt;
			}
			options.detection.blurMode = *mode;
		} else if (arg == "--intensity" || arg == "--sensitivity") {
			const auto value = next();
			const auto number = value ? parseInt(*value) : std::nullopt;
			if (!number) {
				return std::nullopt;
			}
			(arg == "--intensity" ? options.detection.intensity : options.detection.sensitivity) = *number;
		} else if (arg == "--emoji") {
			const auto value = next();
			if (!value) {
				return std::nullopt;
			}
			options.detection.emojiStyle = std::string(*value);
		} else if (arg == "--format") {
			const auto value = next();
			const auto format = value ? Core::parseOutputFormat(*value) : std::nullopt;
			if (!format) {
				return std::nullopt;
			}
			options.format = *format;
		} else if (arg == "--out-dir") {
			const auto value = next();
			if (!value) {
				return std::nullopt;
			}
			options.outDir = std::filesystem::path(*value);
		} else if (arg == "--help" || arg == "-h") {
			return std::nullopt;
		} else if (arg.starts_with("--")) {
			fmt::print(stderr, "Unknown option {}\n", arg);
			return std::nullopt;
		} else {
			options.inputs.emplace_back(arg);
		}
	}

	if (options.inputs.empty()) {
		return std::nullopt;
	}
	return options;
}

std::optional<std::vector<std::uint8_t>> readFile(const std::filesystem::path &path)
{
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		return std::nullopt;
	}
	return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

int main(int argc, char **argv)
try {
	const std::optional<CliOptions> cli = parseArgs(argc, argv);
	if (!cli) {
		printUsage();
		return kExitUsage;
	}

	Logger::ConsoleLogger logger("[privacy-guard]", cli->verbose);

	Core::RedactorConfig config = Core::RedactorConfig::load(logger);
	if (cli->format) {
		config.outputFormat = *cli->format;
	}

	std::unique_ptr<Detection::ModelRegistry> registry = Detection::ModelRegistry::fromConfig(config, logger);
	const Detection::DetectionEngine engine(*registry, config, logger);
	const Redaction::RegionTransformer transformer(logger);
	const Batch::BatchProcessor processor(engine, transformer, config, logger);

	std::vector<Batch::ImageInput> inputs;
	inputs.reserve(cli->inputs.size());
	for (const std::filesystem::path &path : cli->inputs) {
		std::optional<std::vector<std::uint8_t>> bytes = readFile(path);
		if (!bytes) {
			logger.warn("Cannot read {}", path.string());
			continue;
		}
		inputs.push_back(Batch::ImageInput{std::move(*bytes), path.filename().string()});
	}

	const Core::BatchResult batch = processor.process(inputs, cli->detection);

	std::error_code ec;
	std::filesystem::create_directories(cli->outDir, ec);
	if (ec) {
		logger.error("Cannot create {}: {}", cli->outDir.string(), ec.message());
		return kExitUsage;
	}

	Batch::OutputPathPlanner planner(cli->outDir, logger);
	std::size_t written = 0;
	for (const Core::ProcessedResult &result : batch.results) {
		const std::filesystem::path outPath = planner.claim(result);

		std::ofstream out(outPath, std::ios::binary);
		out.write(reinterpret_cast<const char *>(result.encodedImage.data()),
			  static_cast<std::streamsize>(result.encodedImage.size()));
		if (!out) {
			logger.error("Cannot write {}", outPath.string());
			continue;
		}

		++written;
		fmt::print("{} {} detections={} {:.1f}ms -> {}\n", result.id, result.originalFilename, result.boxes.size(),
			   result.elapsedMs, outPath.string());
	}

	fmt::print("processed {}/{} images, {} detections, {:.1f}ms\n", written, cli->inputs.size(),
		   batch.totalDetections, batch.totalMs);

	return written == cli->inputs.size() ? kExitOk : kExitPartial;
} catch (const std::exception &e) {
	fmt::print(stderr, "privacy-guard: {}\n", e.what());
	return kExitUsage;
}
