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

#include "PrivacyGuard/Detection/PlateFilter.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace PrivacyGuard::Detection {

std::string_view toString(PlateFilterStage stage) noexcept
{
	switch (stage) {
	case PlateFilterStage::Bounds:
		return "bounds";
	case PlateFilterStage::Confidence:
		return "confidence";
	case PlateFilterStage::Aspect:
		return "aspect";
	case PlateFilterStage::VerticalPosition:
		return "y_fraction";
	case PlateFilterStage::Size:
		return "size";
	case PlateFilterStage::Shrink:
		return "shrink";
	default:
		return "unknown";
	}
}

namespace {

PlateFilter::Verdict reject(PlateFilterStage stage, double value, double threshold) noexcept
{
	return PlateFilter::Verdict{std::nullopt, stage, value, threshold};
}

} // namespace

PlateFilter::PlateFilter(Core::PlateFilterConfig config, const Logger::ILogger &logger) noexcept
	: config_(std::move(config)),
	  logger_(logger)
{
}

PlateFilter::Verdict PlateFilter::evaluate(const Core::BoundingBox &candidate, int imageWidth,
					   int imageHeight) const noexcept
{
	const std::optional<Core::BoundingBox> clamped = Core::clampToImage(candidate, imageWidth, imageHeight);
	if (!clamped) {
		return reject(PlateFilterStage::Bounds, 0.0, 0.0);
	}
	Core::BoundingBox box = *clamped;

	if (config_.filterByConfidence && box.confidence < config_.confidenceFloor) {
		return reject(PlateFilterStage::Confidence, box.confidence, config_.confidenceFloor);
	}

	if (config_.filterByAspect) {
		const double aspect = box.aspectRatio();
		if (aspect < config_.minAspect) {
			return reject(PlateFilterStage::Aspect, aspect, config_.minAspect);
		}
		if (aspect > config_.maxAspect) {
			return reject(PlateFilterStage::Aspect, aspect, config_.maxAspect);
		}
	}

	if (config_.filterByYFraction) {
		const double yFraction = box.centerY() / imageHeight;
		if (yFraction < config_.minCenterYFraction) {
			return reject(PlateFilterStage::VerticalPosition, yFraction, config_.minCenterYFraction);
		}
	}

	if (config_.filterBySize) {
		const double widthFraction = static_cast<double>(box.width) / imageWidth;
		if (widthFraction > config_.maxWidthFraction) {
			return reject(PlateFilterStage::Size, widthFraction, config_.maxWidthFraction);
		}
		const double heightFraction = static_cast<double>(box.height) / imageHeight;
		if (heightFraction > config_.maxHeightFraction) {
			return reject(PlateFilterStage::Size, heightFraction, config_.maxHeightFraction);
		}
	}

	if (config_.shrinkEnabled) {
		const int dx = static_cast<int>(std::floor(box.width * config_.shrinkFraction));
		const int dy = static_cast<int>(std::floor(box.height * config_.shrinkFraction));
		const int shrunkWidth = box.width - 2 * dx;
		const int shrunkHeight = box.height - 2 * dy;
		if (shrunkWidth <= 0 || shrunkHeight <= 0) {
			return reject(PlateFilterStage::Shrink, std::min(shrunkWidth, shrunkHeight), 0.0);
		}
		box.x += dx;
		box.y += dy;
		box.width = shrunkWidth;
		box.height = shrunkHeight;

		// A negative fraction grows the box.
		const std::optional<Core::BoundingBox> inside = Core::clampToImage(box, imageWidth, imageHeight);
		if (!inside) {
			return reject(PlateFilterStage::Bounds, 0.0, 0.0);
		}
		box = *inside;

		// Integer rounding can push a borderline box out of the band.
		if (config_.filterByAspect) {
			const double aspect = box.aspectRatio();
			if (aspect < config_.minAspect || aspect > config_.maxAspect) {
				return reject(PlateFilterStage::Aspect, aspect,
					      aspect < config_.minAspect ? config_.minAspect : config_.maxAspect);
			}
		}
	}

	return Verdict{box, PlateFilterStage::Bounds, 0.0, 0.0};
}

std::vector<Core::BoundingBox> PlateFilter::apply(const std::vector<Core::BoundingBox> &candidates, int imageWidth,
						  int imageHeight) const
{
	std::vector<Core::BoundingBox> kept;
	kept.reserve(candidates.size());

	for (const Core::BoundingBox &candidate : candidates) {
		const Verdict verdict = evaluate(candidate, imageWidth, imageHeight);
		if (verdict.box) {
			kept.push_back(*verdict.box);
			continue;
		}

		const std::string box =
			fmt::format("{},{},{}x{}", candidate.x, candidate.y, candidate.width, candidate.height);
		const std::string value = fmt::format("{:.3f}", verdict.value);
		const std::string threshold = fmt::format("{:.3f}", verdict.threshold);
		const std::string confidence = fmt::format("{:.3f}", candidate.confidence);
		logger_.debug("PlateRejected", {{"stage", toString(verdict.stage)},
						{"value", value},
						{"threshold", threshold},
						{"confidence", confidence},
						{"box", box}});
	}

	return kept;
}

} // namespace PrivacyGuard::Detection
