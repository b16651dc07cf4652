/*
 * Privacy Guard - Codec Module
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

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core.hpp>

#include <PrivacyGuard/Core/Types.hpp>

namespace PrivacyGuard::Codec {

/**
 * Decoded raster, always CV_8UC3 in BGR order. Owned by whoever decoded it.
 */
struct DecodedImage {
	cv::Mat pixels;

	int width() const noexcept { return pixels.cols; }
	int height() const noexcept { return pixels.rows; }
};

/**
 * Throws Core::DecodeError on empty, corrupt or unsupported input.
 */
DecodedImage decodeImage(std::span<const std::uint8_t> bytes);

/**
 * `bgr` must be CV_8UC3 in BGR order. Throws Core::EncodeError.
 */
std::vector<std::uint8_t> encodeImage(const cv::Mat &bgr, Core::OutputFormat format);

std::string_view mimeType(Core::OutputFormat format) noexcept;

std::string toDataUri(std::span<const std::uint8_t> encoded, Core::OutputFormat format);

} // namespace PrivacyGuard::Codec
