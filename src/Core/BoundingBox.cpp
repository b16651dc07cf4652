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

#include "PrivacyGuard/Core/BoundingBox.hpp"

#include <algorithm>

namespace PrivacyGuard::Core {

std::string_view toString(Category category) noexcept
{
	switch (category) {
	case Category::Face:
		return "face";
	case Category::LicensePlate:
		return "license_plate";
	default:
		return "unknown";
	}
}

std::optional<BoundingBox> clampToImage(const BoundingBox &box, int imageWidth, int imageHeight) noexcept
{
	if (imageWidth <= 0 || imageHeight <= 0) {
		return std::nullopt;
	}

	// 64-bit sums so that boxes near INT_MAX cannot wrap around
	const long long left = std::max<long long>(0, box.x);
	const long long top = std::max<long long>(0, box.y);
	const long long right = std::min<long long>(imageWidth, static_cast<long long>(box.x) + box.width);
	const long long bottom = std::min<long long>(imageHeight, static_cast<long long>(box.y) + box.height);

	if (right <= left || bottom <= top) {
		return std::nullopt;
	}

	BoundingBox clamped = box;
	clamped.x = static_cast<int>(left);
	clamped.y = static_cast<int>(top);
	clamped.width = static_cast<int>(right - left);
	clamped.height = static_cast<int>(bottom - top);
	return clamped;
}

std::optional<BoundingBox> expandBy(const BoundingBox &box, int padding, int imageWidth, int imageHeight) noexcept
{
	BoundingBox expanded = box;
	expanded.x -= padding;
	expanded.y -= padding;
	expanded.width += 2 * padding;
	expanded.height += 2 * padding;
	return clampToImage(expanded, imageWidth, imageHeight);
}

} // namespace PrivacyGuard::Core
