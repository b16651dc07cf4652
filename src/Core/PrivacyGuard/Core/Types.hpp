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

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "BoundingBox.hpp"

namespace PrivacyGuard::Core {

enum class BlurMode : int {
	Gaussian = 0,
	Pixelation = 1,
	Emoji = 2,
};

std::optional<BlurMode> parseBlurMode(std::string_view name) noexcept;
std::string_view toString(BlurMode mode) noexcept;

enum class OutputFormat : int {
	Png = 0,
	Jpeg = 1,
	Webp = 2,
};

std::optional<OutputFormat> parseOutputFormat(std::string_view name) noexcept;
std::string_view toString(OutputFormat format) noexcept;

struct DetectionOptions {
	BlurMode blurMode = BlurMode::Gaussian;
	int intensity = 80;
	bool detectFaces = true;
	bool detectPlates = true;
	int sensitivity = 60;
	std::string emojiStyle = "smile";

	DetectionOptions clamped() const
	{
		DetectionOptions result = *this;
		result.intensity = std::clamp(intensity, 0, 100);
		result.sensitivity = std::clamp(sensitivity, 0, 100);
		return result;
	}
};

struct ProcessedResult {
	std::string id;
	std::string originalFilename;
	OutputFormat format = OutputFormat::Png;
	std::vector<std::uint8_t> encodedImage;
	std::string dataUri;
	std::vector<BoundingBox> boxes;
	double elapsedMs = 0.0;
};

struct BatchResult {
	std::vector<ProcessedResult> results;
	std::size_t totalDetections = 0;
	double totalMs = 0.0;
};

} // namespace PrivacyGuard::Core
