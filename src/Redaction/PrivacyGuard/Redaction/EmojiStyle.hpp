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

#include <string_view>

#include <opencv2/core.hpp>

namespace PrivacyGuard::Redaction {

enum class EmojiStyle : int {
	Plain = 0,
	Smile,
	Cool,
	Monkey,
	Robot,
	Star,
	Heart,
	Lock,
};

/**
 * Accepts the ASCII names (smile, cool, ...) and the matching emoji
 * characters. U+FE0F variation selectors and surrounding blanks are
 * ignored. Anything unrecognized maps to EmojiStyle::Plain.
 */
EmojiStyle parseEmojiStyle(std::string_view key) noexcept;

std::string_view toString(EmojiStyle style) noexcept;

/**
 * Draws the glyph centered in `canvas`, sized to its shorter side.
 * `canvas` must be CV_8UC3 in BGR order.
 */
void drawEmojiGlyph(cv::Mat &canvas, EmojiStyle style);

} // namespace PrivacyGuard::Redaction
