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

#include <optional>
#include <string_view>

#include <opencv2/core.hpp>

namespace PrivacyGuard::Core {

enum class Category : int {
	Face = 0,
	LicensePlate = 1,
};

constexpr int kCategoryCount = 2;

std::string_view toString(Category category) noexcept;

/**
 * Axis-aligned pixel rectangle, origin at the top-left corner of the image.
 * Boxes leaving the detection pipeline always satisfy width > 0, height > 0,
 * x + width <= image width and y + height <= image height.
 */
struct BoundingBox {
	int x = 0;
	int y = 0;
	int width = 0;
	int height = 0;
	float confidence = 0.0f;
	Category category = Category::Face;
	bool enabled = true;

	cv::Rect toRect() const noexcept { return {x, y, width, height}; }

	double centerY() const noexcept { return y + height / 2.0; }

	double aspectRatio() const noexcept { return height > 0 ? static_cast<double>(width) / height : 0.0; }

	bool operator==(const BoundingBox &) const = default;
};

/**
 * Intersects the box with the image rectangle. Returns std::nullopt when
 * nothing with positive width and height is left.
 */
std::optional<BoundingBox> clampToImage(const BoundingBox &box, int imageWidth, int imageHeight) noexcept;

/**
 * Grows the box by `padding` pixels on every side and clamps the result.
 */
std::optional<BoundingBox> expandBy(const BoundingBox &box, int padding, int imageWidth, int imageHeight) noexcept;

} // namespace PrivacyGuard::Core
