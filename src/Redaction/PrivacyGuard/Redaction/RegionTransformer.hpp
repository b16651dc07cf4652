/*
 * Privacy Guard - Redaction Module
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
#include <PrivacyGuard/Core/Types.hpp>
#include <PrivacyGuard/Logger/ILogger.hpp>

#include "EmojiStyle.hpp"

namespace PrivacyGuard::Redaction {

/**
 * @brief Applies one redaction style to a list of boxes.
 *
 * Boxes are processed in the order given, each one on top of what the
 * previous ones left, so overlapping regions compose. Disabled boxes are
 * skipped. A box that clamps to nothing is a no-op.
 *
 * The per-mode functions modify `image` in place, touch only pixels inside
 * the clamped box and return false when nothing was done.
 */
class RegionTransformer {
public:
	explicit RegionTransformer(const Logger::ILogger &logger) noexcept : logger_(logger) {}

	/**
	 * Returns a redacted copy; `bgr` is left untouched.
	 */
	cv::Mat apply(const cv::Mat &bgr, const std::vector<Core::BoundingBox> &boxes,
		      const Core::DetectionOptions &options) const;

	static bool applyGaussian(cv::Mat &image, const Core::BoundingBox &box, int intensity);
	static bool applyPixelation(cv::Mat &image, const Core::BoundingBox &box, int intensity);
	static bool applyEmoji(cv::Mat &image, const Core::BoundingBox &box, int intensity, EmojiStyle style);

	static int gaussianKernelSize(int width, int height, int intensity) noexcept;
	static int gaussianExtraPasses(int intensity) noexcept;
	static int pixelBlockSize(int width, int height, int intensity) noexcept;

private:
	const Logger::ILogger &logger_;
};

} // namespace PrivacyGuard::Redaction
