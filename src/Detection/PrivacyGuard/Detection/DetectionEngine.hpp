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

#include <vector>

#include <opencv2/core.hpp>

#include <PrivacyGuard/Core/BoundingBox.hpp>
#include <PrivacyGuard/Core/RedactorConfig.hpp>
#include <PrivacyGuard/Logger/ILogger.hpp>

#include "ConfidenceCalibration.hpp"
#include "ModelRegistry.hpp"
#include "PlateFilter.hpp"

namespace PrivacyGuard::Detection {

/**
 * Turns raw backend candidates into redaction boxes.
 *
 * Thresholds are calibrated against whichever backend actually served the
 * capability. Faces are padded; plates go through PlateFilter. A failure in
 * one capability is logged and yields no boxes for it, the other capability
 * still runs. Faces come first in the returned list, then plates.
 */
class DetectionEngine {
public:
	DetectionEngine(ModelRegistry &registry, const Core::RedactorConfig &config, const Logger::ILogger &logger);

	std::vector<Core::BoundingBox> detect(const cv::Mat &bgr, bool detectFaces, bool detectPlates,
					      int sensitivity) const;

private:
	std::vector<Core::BoundingBox> detectCapability(const cv::Mat &bgr, Core::Category category,
							int sensitivity) const noexcept;

	std::vector<Core::BoundingBox> detectFaceBoxes(const cv::Mat &bgr, int sensitivity) const;
	std::vector<Core::BoundingBox> detectPlateBoxes(const cv::Mat &bgr, int sensitivity) const;

	std::vector<Core::BoundingBox> thresholded(const ServedDetections &served, Core::Category category,
						   int sensitivity) const;

	ModelRegistry &registry_;
	const CalibrationTable calibration_;
	const float facePaddingFraction_;
	const PlateFilter plateFilter_;
	const Logger::ILogger &logger_;
};

} // namespace PrivacyGuard::Detection
