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

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include <PrivacyGuard/Core/BoundingBox.hpp>
#include <PrivacyGuard/Core/RedactorConfig.hpp>
#include <PrivacyGuard/Logger/ILogger.hpp>

namespace PrivacyGuard::Detection {

enum class PlateFilterStage : int {
	Bounds = 0,
	Confidence = 1,
	Aspect = 2,
	VerticalPosition = 3,
	Size = 4,
	Shrink = 5,
};

std::string_view toString(PlateFilterStage stage) noexcept;

/**
 * Geometric post-filter for license plate candidates.
 *
 * A box survives only if it passes every enabled stage. Shrink always runs
 * last; when the aspect stage is enabled it is checked again on the shrunk
 * box so that every returned box satisfies the configured aspect band.
 */
class PlateFilter {
public:
	struct Verdict {
		std::optional<Core::BoundingBox> box;
		PlateFilterStage stage = PlateFilterStage::Bounds; // meaningful only when rejected
		double value = 0.0;
		double threshold = 0.0;
	};

	PlateFilter(Core::PlateFilterConfig config, const Logger::ILogger &logger) noexcept;

	Verdict evaluate(const Core::BoundingBox &candidate, int imageWidth, int imageHeight) const noexcept;

	std::vector<Core::BoundingBox> apply(const std::vector<Core::BoundingBox> &candidates, int imageWidth,
					     int imageHeight) const;

	const Core::PlateFilterConfig &config() const noexcept { return config_; }

private:
	const Core::PlateFilterConfig config_;
	const Logger::ILogger &logger_;
};

} // namespace PrivacyGuard::Detection
