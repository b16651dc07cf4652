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

#include "PrivacyGuard/Core/Types.hpp"

#include <cctype>

namespace PrivacyGuard::Core {

namespace {

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept
{
	return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
		return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
	});
}

} // namespace

std::optional<BlurMode> parseBlurMode(std::string_view name) noexcept
{
	if (equalsIgnoreCase(name, "gaussian")) {
		return BlurMode::Gaussian;
	}
	if (equalsIgnoreCase(name, "pixelation")) {
		return BlurMode::Pixelation;
	}
	if (equalsIgnoreCase(name, "emoji")) {
		return BlurMode::Emoji;
	}
	return std::nullopt;
}

std::string_view toString(BlurMode mode) noexcept
{
	switch (mode) {
	case BlurMode::Gaussian:
		return "gaussian";
	case BlurMode::Pixelation:
		return "pixelation";
	case BlurMode::Emoji:
		return "emoji";
	default:
		return "unknown";
	}
}

std::optional<OutputFormat> parseOutputFormat(std::string_view name) noexcept
{
	if (equalsIgnoreCase(name, "png")) {
		return OutputFormat::Png;
	}
	if (equalsIgnoreCase(name, "jpeg") || equalsIgnoreCase(name, "jpg")) {
		return OutputFormat::Jpeg;
	}
	if (equalsIgnoreCase(name, "webp")) {
		return OutputFormat::Webp;
	}
	return std::nullopt;
}

std::string_view toString(OutputFormat format) noexcept
{
	switch (format) {
	case OutputFormat::Png:
		return "png";
	case OutputFormat::Jpeg:
		return "jpeg";
	case OutputFormat::Webp:
		return "webp";
	default:
		return "unknown";
	}
}

} // namespace PrivacyGuard::Core
