/*
 * Privacy Guard - Core Module
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

#include "PrivacyGuard/Core/RedactorConfig.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <system_error>

#ifndef PRIVACY_GUARD_DEFAULT_MODEL_DIR
#define PRIVACY_GUARD_DEFAULT_MODEL_DIR "models"
#endif

namespace PrivacyGuard::Core {

namespace {

constexpr std::string_view kEnvPrefix = "PRIVACY_GUARD_";
constexpr std::size_t kMaxFileSizeMb = 1024;
constexpr std::size_t kMaxBatchSize = 1000;

std::string modelFile(const std::string &modelDir, const char *fileName)
{
	return (std::filesystem::path(modelDir) / fileName).string();
}

std::string toLower(std::string_view value)
{
	std::string result(value);
	for (char &c : result) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return result;
}

std::optional<bool> parseBool(std::string_view value)
{
	const std::string lowered = toLower(value);
	if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
		return true;
	}
	if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
		return false;
	}
	return std::nullopt;
}

template<typename T> std::optional<T> parseNumber(std::string_view value)
{
	T result{};
	const char *first = value.data();
	const char *last = value.data() + value.size();
	auto [ptr, ec] = std::from_chars(first, last, result);
	if (ec != std::errc() || ptr != last) {
		return std::nullopt;
	}
	return result;
}

class EnvOverlay {
public:
	EnvOverlay(const Logger::ILogger &logger, const RedactorConfig::EnvLookup &lookup)
		: logger_(logger),
		  lookup_(lookup)
	{
	}

	std::optional<std::string> raw(std::string_view key) const
	{
		std::string name(kEnvPrefix);
		name += key;
		return lookup_(name);
	}

	void string(std::string_view key, std::string &target) const
	{
		if (auto value = raw(key); value && !value->empty()) {
			logger_.info("Loaded {}{} from environment: {}", kEnvPrefix, key, *value);
			target = *value;
		}
	}

	void flag(std::string_view key, bool &target) const
	{
		auto value = raw(key);
		if (!value) {
			return;
		}
		if (auto parsed = parseBool(*value)) {
			target = *parsed;
		} else {
			logger_.warn("Ignoring {}{}={}: expected a boolean", kEnvPrefix, key, *value);
		}
	}

	template<typename T> void number(std::string_view key, T &target) const
	{
		auto value = raw(key);
		if (!value) {
			return;
		}
		if (auto parsed = parseNumber<T>(*value)) {
			target = *parsed;
		} else {
			logger_.warn("Ignoring {}{}={}: expected a number", kEnvPrefix, key, *value);
		}
	}

	template<typename T> void number(std::string_view key, T &target, T min, T max) const
	{
		T candidate = target;
		number(key, candidate);
		if (candidate < min || candidate > max) {
			logger_.warn("Ignoring {}{}={}: expected a value in [{}, {}]", kEnvPrefix, key, candidate, min,
				     max);
			return;
		}
		target = candidate;
	}

private:
	const Logger::ILogger &logger_;
	const RedactorConfig::EnvLookup &lookup_;
};

} // namespace

RedactorConfig RedactorConfig::defaults(const std::string &modelDir)
{
	RedactorConfig config;

	config.faceModel.paramPath = modelFile(modelDir, "yolov8n-face.ncnn.param");
	config.faceModel.binPath = modelFile(modelDir, "yolov8n-face.ncnn.bin");
	config.faceModel.classIds = {0};
	config.faceCascade.path = modelFile(modelDir, "haarcascade_frontalface_default.xml");
	config.faceCascade.minNeighbors = 5;

	config.plateModel.paramPath = modelFile(modelDir, "yolov8s-license-plate.ncnn.param");
	config.plateModel.binPath = modelFile(modelDir, "yolov8s-license-plate.ncnn.bin");
	config.plateModel.inputSize = 1280;
	config.plateModel.classIds = {0};
	config.plateCascade.path = modelFile(modelDir, "haarcascade_russian_plate_number.xml");
	config.plateCascade.minNeighbors = 4;
	config.plateCascade.minSizePx = 16;

	return config;
}

RedactorConfig RedactorConfig::load(const Logger::ILogger &logger)
{
	return load(logger, [](std::string_view name) -> std::optional<std::string> {
		const std::string key(name);
		if (const char *value = std::getenv(key.c_str())) {
			return std::string(value);
		}
		return std::nullopt;
	});
}

RedactorConfig RedactorConfig::load(const Logger::ILogger &logger, const EnvLookup &lookup)
{
	const EnvOverlay env(logger, lookup);

	std::string modelDir = PRIVACY_GUARD_DEFAULT_MODEL_DIR;
	env.string("MODEL_DIR", modelDir);

	RedactorConfig config = defaults(modelDir);

	env.string("FACE_PARAM_PATH", config.faceModel.paramPath);
	env.string("FACE_BIN_PATH", config.faceModel.binPath);
	env.string("FACE_CASCADE_PATH", config.faceCascade.path);
	env.string("PLATE_PARAM_PATH", config.plateModel.paramPath);
	env.string("PLATE_BIN_PATH", config.plateModel.binPath);
	env.string("PLATE_CASCADE_PATH", config.plateCascade.path);

	env.number("NUM_THREADS", config.numThreads, 1, 64);
	env.number("FACE_PADDING", config.facePaddingFraction, 0.0f, 1.0f);

	PlateFilterConfig &plate = config.plateFilter;
	env.flag("PLATE_FILTER_BY_CONFIDENCE", plate.filterByConfidence);
	env.number("PLATE_CONFIDENCE_FLOOR", plate.confidenceFloor, 0.0f, 1.0f);
	env.flag("PLATE_FILTER_BY_ASPECT", plate.filterByAspect);
	env.number("PLATE_MIN_ASPECT", plate.minAspect, 0.1f, 100.0f);
	env.number("PLATE_MAX_ASPECT", plate.maxAspect, 0.1f, 100.0f);
	env.flag("PLATE_FILTER_BY_Y_FRAC", plate.filterByYFraction);
	env.number("PLATE_MIN_Y_FRAC", plate.minCenterYFraction, 0.0f, 1.0f);
	env.flag("PLATE_FILTER_BY_SIZE", plate.filterBySize);
	env.number("PLATE_MAX_WIDTH_FRAC", plate.maxWidthFraction, 0.0f, 1.0f);
	env.number("PLATE_MAX_HEIGHT_FRAC", plate.maxHeightFraction, 0.0f, 1.0f);
	env.flag("PLATE_SHRINK", plate.shrinkEnabled);
	env.number("PLATE_SHRINK_FRAC", plate.shrinkFraction, 0.0f, 0.5f);

	env.number("MAX_FILE_SIZE_MB", config.maxFileSizeMb, std::size_t{1}, kMaxFileSizeMb);
	env.number("MAX_BATCH_SIZE", config.maxBatchSize, std::size_t{1}, kMaxBatchSize);

	if (auto value = env.raw("OUTPUT_FORMAT")) {
		if (auto format = parseOutputFormat(*value)) {
			config.outputFormat = *format;
		} else {
			logger.warn("Ignoring {}OUTPUT_FORMAT={}: expected png, jpeg or webp", kEnvPrefix, *value);
		}
	}

	if (plate.minAspect > plate.maxAspect) {
		logger.warn("Plate aspect band [{}, {}] is inverted, restoring defaults", plate.minAspect, plate.maxAspect);
		const PlateFilterConfig fallback;
		plate.minAspect = fallback.minAspect;
		plate.maxAspect = fallback.maxAspect;
	}

	return config;
}

} // namespace PrivacyGuard::Core
