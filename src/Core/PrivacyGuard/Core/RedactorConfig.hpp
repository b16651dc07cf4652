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

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <PrivacyGuard/Logger/ILogger.hpp>

#include "Types.hpp"

namespace PrivacyGuard::Core {

/**
 * Confidence threshold range of one backend. Sensitivity 0 maps to `max`,
 * sensitivity 100 maps to `min`.
 */
struct ConfidenceBand {
	float min;
	float max;
};

struct YoloModelConfig {
	std::string paramPath;
	std::string binPath;
	int inputSize = 640;
	std::vector<int> classIds; // empty accepts every class
	float nmsThreshold = 0.45f;
	std::string inputBlob = "in0";
	std::string outputBlob = "out0";
};

struct CascadeModelConfig {
	std::string path;
	double scaleFactor = 1.1;
	int minNeighbors = 3;
	int minSizePx = 24;
};

struct PlateFilterConfig {
	bool filterByConfidence = true;
	float confidenceFloor = 0.10f;

	bool filterByAspect = true;
	float minAspect = 1.5f;
	float maxAspect = 6.5f;

	bool filterByYFraction = true;
	float minCenterYFraction = 0.25f;

	bool filterBySize = true;
	float maxWidthFraction = 0.60f;
	float maxHeightFraction = 0.35f;

	bool shrinkEnabled = true;
	float shrinkFraction = 0.05f;
};

struct RedactorConfig {
	YoloModelConfig faceModel;
	CascadeModelConfig faceCascade;
	YoloModelConfig plateModel;
	CascadeModelConfig plateCascade;

	ConfidenceBand learnedFaceBand{0.20f, 0.70f};
	ConfidenceBand classicalFaceBand{0.35f, 0.85f};
	ConfidenceBand learnedPlateBand{0.10f, 0.60f};
	ConfidenceBand classicalPlateBand{0.30f, 0.80f};

	float facePaddingFraction = 0.1f;

	PlateFilterConfig plateFilter;

	int numThreads = 2;

	std::size_t maxFileSizeMb = 10;
	std::size_t maxBatchSize = 10;
	std::vector<std::string> allowedExtensions{"jpg", "jpeg", "png", "webp"};

	OutputFormat outputFormat = OutputFormat::Png;

	using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

	/**
	 * Compiled-in defaults with model files resolved under `modelDir`.
	 */
	static RedactorConfig defaults(const std::string &modelDir);

	/**
	 * Defaults overlaid with PRIVACY_GUARD_* environment variables.
	 * Values that fail to parse are reported and the default is kept.
	 */
	static RedactorConfig load(const Logger::ILogger &logger);

	static RedactorConfig load(const Logger::ILogger &logger, const EnvLookup &lookup);
};

} // namespace PrivacyGuard::Core
