/*
 * Privacy Guard - Detection Module
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

#include "PrivacyGuard/Detection/DetectionEngine.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>
#include <string>

#include <fmt/format.h>

namespace PrivacyGuard::Detection {

DetectionEngine::DetectionEngine(ModelRegistry &registry, const Core::RedactorConfig &config,
				 const Logger::ILogger &logger)
	: registry_(registry),
	  calibration_(CalibrationTable::fromConfig(config)),
	  facePaddingFraction_(config.facePaddingFraction),
	  plateFilter_(config.plateFilter, logger),
	  logger_(logger)
{
}

std::vector<Core::BoundingBox> DetectionEngine::detect(const cv::Mat &bgr, bool detectFaces, bool detectPlates,
						       int sensitivity) const
{
	std::vector<Core::BoundingBox> boxes;

	if (detectFaces) {
		std::vector<Core::BoundingBox> faces = detectCapability(bgr, Core::Category::Face, sensitivity);
		boxes.insert(boxes.end(), faces.begin(), faces.end());
	}

	if (detectPlates) {
		std::vector<Core::BoundingBox> plates = detectCapability(bgr, Core::Category::LicensePlate, sensitivity);
		boxes.insert(boxes.end(), plates.begin(), plates.end());
	}

	return boxes;
}

std::vector<Core::BoundingBox> DetectionEngine::detectCapability(const cv::Mat &bgr, Core::Category category,
								 int sensitivity) const noexcept
try {
	if (category == Core::Category::Face) {
		return detectFaceBoxes(bgr, sensitivity);
	}
	return detectPlateBoxes(bgr, sensitivity);
} catch (const std::exception &e) {
	logger_.warn("DetectionFailed", {{"capability", Core::toString(category)}, {"reason", e.what()}});
	return {};
}

std::vector<Core::BoundingBox> DetectionEngine::thresholded(const ServedDetections &served, Core::Category category,
							    int sensitivity) const
{
	std::vector<Core::BoundingBox> boxes;
	if (!served.servedBy) {
		return boxes;
	}

	const float threshold = calibration_.threshold(category, *served.servedBy, sensitivity);

	for (const RawDetection &raw : served.detections) {
		if (raw.score < threshold) {
			continue;
		}
		boxes.push_back(Core::BoundingBox{raw.box.x, raw.box.y, raw.box.width, raw.box.height, raw.score,
						  category, true});
	}

	const std::string thresholdText = fmt::format("{:.3f}", threshold);
	const std::string candidates = std::to_string(served.detections.size());
	const std::string passed = std::to_string(boxes.size());
	logger_.debug("ConfidenceFilter", {{"capability", Core::toString(category)},
					   {"backend", served.backendName},
					   {"kind", toString(*served.servedBy)},
					   {"threshold", thresholdText},
					   {"candidates", candidates},
					   {"passed", passed}});

	return boxes;
}

std::vector<Core::BoundingBox> DetectionEngine::detectFaceBoxes(const cv::Mat &bgr, int sensitivity) const
{
	const ServedDetections served = registry_.detect(bgr, Core::Category::Face);
	const std::vector<Core::BoundingBox> candidates = thresholded(served, Core::Category::Face, sensitivity);

	std::vector<Core::BoundingBox> faces;
	faces.reserve(candidates.size());
	for (const Core::BoundingBox &candidate : candidates) {
		const std::optional<Core::BoundingBox> clamped = Core::clampToImage(candidate, bgr.cols, bgr.rows);
		if (!clamped) {
			continue;
		}

		const int padding =
			static_cast<int>(std::floor(std::min(clamped->width, clamped->height) * facePaddingFraction_));
		const std::optional<Core::BoundingBox> padded = Core::expandBy(*clamped, padding, bgr.cols, bgr.rows);
		if (padded) {
			faces.push_back(*padded);
		}
	}
	return faces;
}

std::vector<Core::BoundingBox> DetectionEngine::detectPlateBoxes(const cv::Mat &bgr, int sensitivity) const
{
	const ServedDetections served = registry_.detect(bgr, Core::Category::LicensePlate);
	const std::vector<Core::BoundingBox> candidates =
		thresholded(served, Core::Category::LicensePlate, sensitivity);
	return plateFilter_.apply(candidates, bgr.cols, bgr.rows);
}

} // namespace PrivacyGuard::Detection
