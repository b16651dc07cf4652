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

#include <algorithm>
#include <array>
#include <cstddef>

#include <PrivacyGuard/Core/BoundingBox.hpp>
#include <PrivacyGuard/Core/RedactorConfig.hpp>

#include "IDetectorBackend.hpp"

namespace PrivacyGuard::Detection {

/**
 * Linear interpolation from the caller's sensitivity knob to a confidence
 * threshold inside `band`. Sensitivity 0 gives band.max, 100 gives band.min.
 */
inline float confidenceThreshold(int sensitivity, const Core::ConfidenceBand &band) noexcept
{
	const float s = static_cast<float>(std::clamp(sensitivity, 0, 100)) / 100.0f;
	return band.max - (band.max - band.min) * s;
}

/**
 * One band per (category, backend kind). Learned and classical scores live
 * on unrelated scales, so a band is only ever looked up with the kind of
 * the backend that produced the scores.
 */
class CalibrationTable {
public:
	CalibrationTable(Core::ConfidenceBand learnedFace, Core::ConfidenceBand classicalFace,
			 Core::ConfidenceBand learnedPlate, Core::ConfidenceBand classicalPlate) noexcept
		: bands_{{{learnedFace, classicalFace}, {learnedPlate, classicalPlate}}}
	{
	}

	static CalibrationTable fromConfig(const Core::RedactorConfig &config) noexcept
	{
		return CalibrationTable(config.learnedFaceBand, config.classicalFaceBand, config.learnedPlateBand,
					config.classicalPlateBand);
	}

	const Core::ConfidenceBand &bandFor(Core::Category category, BackendKind kind) const noexcept
	{
		return bands_[static_cast<std::size_t>(category)][static_cast<std::size_t>(kind)];
	}

	float threshold(Core::Category category, BackendKind kind, int sensitivity) const noexcept
	{
		return confidenceThreshold(sensitivity, bandFor(category, kind));
	}

private:
	std::array<std::array<Core::ConfidenceBand, 2>, Core::kCategoryCount> bands_;
};

} // namespace PrivacyGuard::Detection
