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

#include "PrivacyGuard/Redaction/RegionTransformer.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <opencv2/imgproc.hpp>

namespace PrivacyGuard::Redaction {

namespace {

std::optional<cv::Rect> regionOf(const cv::Mat &image, const Core::BoundingBox &box) noexcept
{
	const std::optional<Core::BoundingBox> clamped = Core::clampToImage(box, image.cols, image.rows);
	if (!clamped) {
		return std::nullopt;
	}
	return clamped->toRect();
}

} // namespace

int RegionTransformer::gaussianKernelSize(int width, int height, int intensity) noexcept
{
	int kernel = std::max(3, std::min(width, height) * intensity / 100);
	if (kernel % 2 == 0) {
		kernel += 1;
	}
	return kernel;
}

int RegionTransformer::gaussianExtraPasses(int intensity) noexcept
{
	return intensity > 50 ? (intensity - 50) / 25 + 1 : 0;
}

int RegionTransformer::pixelBlockSize(int width, int height, int intensity) noexcept
{
	return std::max(2, std::min(width, height) * intensity / 400);
}

bool RegionTransformer::applyGaussian(cv::Mat &image, const Core::BoundingBox &box, int intensity)
{
	const std::optional<cv::Rect> rect = regionOf(image, box);
	if (!rect) {
		return false;
	}

	// Work on a copy so the border extrapolation never reads outside the box.
	cv::Mat roi = image(*rect);
	cv::Mat region = roi.clone();

	const int kernel = gaussianKernelSize(rect->width, rect->height, intensity);
	const cv::Size kernelSize(kernel, kernel);

	cv::GaussianBlur(region, region, kernelSize, 0);
	const int extraPasses = gaussianExtraPasses(intensity);
	for (int i = 0; i < extraPasses; ++i) {
		cv::GaussianBlur(region, region, kernelSize, 0);
	}

	region.copyTo(roi);
	return true;
}

bool RegionTransformer::applyPixelation(cv::Mat &image, const Core::BoundingBox &box, int intensity)
{
	const std::optional<cv::Rect> rect = regionOf(image, box);
	if (!rect) {
		return false;
	}

	cv::Mat roi = image(*rect);

	const int block = pixelBlockSize(rect->width, rect->height, intensity);
	const cv::Size smallSize(std::max(1, rect->width / block), std::max(1, rect->height / block));

	cv::Mat small;
	cv::resize(roi, small, smallSize, 0, 0, cv::INTER_AREA);

	cv::Mat blocky;
	cv::resize(small, blocky, rect->size(), 0, 0, cv::INTER_NEAREST);

	blocky.copyTo(roi);
	return true;
}

bool RegionTransformer::applyEmoji(cv::Mat &image, const Core::BoundingBox &box, int intensity, EmojiStyle style)
{
	const std::optional<cv::Rect> rect = regionOf(image, box);
	if (!rect) {
		return false;
	}

	const double alpha = std::clamp(intensity, 0, 100) / 100.0;
	if (alpha <= 0.0) {
		return true;
	}

	cv::Mat roi = image(*rect);
	cv::Mat glyphLayer = roi.clone();
	drawEmojiGlyph(glyphLayer, style);

	cv::addWeighted(glyphLayer, alpha, roi, 1.0 - alpha, 0.0, roi);
	return true;
}

cv::Mat RegionTransformer::apply(const cv::Mat &bgr, const std::vector<Core::BoundingBox> &boxes,
				 const Core::DetectionOptions &options) const
{
	cv::Mat result = bgr.clone();
	if (result.empty()) {
		return result;
	}

	const Core::DetectionOptions opts = options.clamped();
	const EmojiStyle style = parseEmojiStyle(opts.emojiStyle);

	for (const Core::BoundingBox &box : boxes) {
		if (!box.enabled) {
			continue;
		}

		bool applied = false;
		switch (opts.blurMode) {
		case Core::BlurMode::Gaussian:
			applied = applyGaussian(result, box, opts.intensity);
			break;
		case Core::BlurMode::Pixelation:
			applied = applyPixelation(result, box, opts.intensity);
			break;
		case Core::BlurMode::Emoji:
			applied = applyEmoji(result, box, opts.intensity, style);
			break;
		}

		if (!applied) {
			const std::string rect = fmt::format("{},{},{}x{}", box.x, box.y, box.width, box.height);
			const std::string image = fmt::format("{}x{}", result.cols, result.rows);
			logger_.debug("TransformSkipped", {{"mode", Core::toString(opts.blurMode)},
							   {"category", Core::toString(box.category)},
							   {"box", rect},
							   {"image", image}});
		}
	}

	return result;
}

} // namespace PrivacyGuard::Redaction
