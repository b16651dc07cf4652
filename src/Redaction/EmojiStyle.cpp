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

#include "PrivacyGuard/Redaction/EmojiStyle.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace PrivacyGuard::Redaction {

namespace {

constexpr std::string_view kVariationSelector16 = "\xEF\xB8\x8F";

constexpr std::array<std::pair<std::string_view, EmojiStyle>, 16> kStyleKeys{{
	{"smile", EmojiStyle::Smile},
	{"\xF0\x9F\x98\x80", EmojiStyle::Smile}, // U+1F600
	{"cool", EmojiStyle::Cool},
	{"\xF0\x9F\x98\x8E", EmojiStyle::Cool}, // U+1F60E
	{"monkey", EmojiStyle::Monkey},
	{"\xF0\x9F\x90\xB5", EmojiStyle::Monkey}, // U+1F435
	{"\xF0\x9F\x99\x88", EmojiStyle::Monkey}, // U+1F648
	{"robot", EmojiStyle::Robot},
	{"\xF0\x9F\xA4\x96", EmojiStyle::Robot}, // U+1F916
	{"star", EmojiStyle::Star},
	{"\xE2\xAD\x90", EmojiStyle::Star}, // U+2B50
	{"heart", EmojiStyle::Heart},
	{"\xE2\x9D\xA4", EmojiStyle::Heart}, // U+2764
	{"lock", EmojiStyle::Lock},
	{"\xF0\x9F\x94\x92", EmojiStyle::Lock}, // U+1F512
	{"plain", EmojiStyle::Plain},
}};

std::string normalizeKey(std::string_view key)
{
	std::string normalized;
	normalized.reserve(key.size());

	while (!key.empty()) {
		if (key.substr(0, kVariationSelector16.size()) == kVariationSelector16) {
			key.remove_prefix(kVariationSelector16.size());
			continue;
		}
		const char c = key.front();
		key.remove_prefix(1);
		if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
			continue;
		}
		normalized.push_back(c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c);
	}

	return normalized;
}

// BGR
const cv::Scalar kYellow(0, 220, 255);
const cv::Scalar kYellowBorder(0, 180, 220);
const cv::Scalar kBlack(0, 0, 0);
const cv::Scalar kFur(80, 130, 200);
const cv::Scalar kFurBorder(50, 90, 140);
const cv::Scalar kEar(60, 100, 160);
const cv::Scalar kHand(100, 160, 220);
const cv::Scalar kMetal(180, 180, 180);
const cv::Scalar kMetalBorder(110, 110, 110);
const cv::Scalar kLed(255, 255, 0);
const cv::Scalar kAntennaTip(0, 0, 220);
const cv::Scalar kGold(0, 215, 255);
const cv::Scalar kGoldBorder(0, 165, 200);
const cv::Scalar kRed(0, 0, 220);
const cv::Scalar kLockBody(200, 150, 50);
const cv::Scalar kLockBorder(150, 100, 30);
const cv::Scalar kShackle(100, 100, 100);
const cv::Scalar kKeyhole(50, 50, 50);
const cv::Scalar kPlain(0, 200, 255);

struct Glyph {
	cv::Point center;
	int radius;
};

void drawSmile(cv::Mat &canvas, const Glyph &g)
{
	const auto [c, r] = g;
	cv::circle(canvas, c, r, kYellow, cv::FILLED);
	cv::circle(canvas, c, r, kYellowBorder, 3);

	const int eyeRadius = std::max(3, r / 6);
	cv::circle(canvas, {c.x - r / 3, c.y - r / 4}, eyeRadius, kBlack, cv::FILLED);
	cv::circle(canvas, {c.x + r / 3, c.y - r / 4}, eyeRadius, kBlack, cv::FILLED);

	cv::ellipse(canvas, {c.x, c.y + r / 6}, {r / 2, r / 3}, 0, 0, 180, kBlack, std::max(2, r / 15));
}

void drawCool(cv::Mat &canvas, const Glyph &g)
{
	const auto [c, r] = g;
	cv::circle(canvas, c, r, kYellow, cv::FILLED);
	cv::circle(canvas, c, r, kYellowBorder, 3);

	const int bandY = c.y - r / 4;
	const int bandHeight = std::max(4, r / 4);
	cv::rectangle(canvas, cv::Point(c.x - r + r / 6, bandY - bandHeight / 2),
		      cv::Point(c.x + r - r / 6, bandY + bandHeight / 2), kBlack, cv::FILLED);

	cv::ellipse(canvas, {c.x, c.y + r / 3}, {r / 3, r / 6}, 0, 0, 180, kBlack, std::max(2, r / 15));
}

void drawMonkey(cv::Mat &canvas, const Glyph &g)
{
	const auto [c, r] = g;
	cv::circle(canvas, c, r, kFur, cv::FILLED);
	cv::circle(canvas, c, r, kFurBorder, 3);

	const int earRadius = r / 3;
	cv::circle(canvas, {c.x - r, c.y - r / 2}, earRadius, kEar, cv::FILLED);
	cv::circle(canvas, {c.x + r, c.y - r / 2}, earRadius, kEar, cv::FILLED);

	// Hands over the eyes
	cv::ellipse(canvas, {c.x - r / 3, c.y - r / 6}, {r / 2, r / 3}, 0, 0, 360, kHand, cv::FILLED);
	cv::ellipse(canvas, {c.x + r / 3, c.y - r / 6}, {r / 2, r / 3}, 0, 0, 360, kHand, cv::FILLED);
}

void drawRobot(cv::Mat &canvas, const Glyph &g)
{
	const auto [c, r] = g;
	const cv::Point headTopLeft(c.x - r * 4 / 5, c.y - r * 3 / 5);
	const cv::Point headBottomRight(c.x + r * 4 / 5, c.y + r * 4 / 5);
	cv::rectangle(canvas, headTopLeft, headBottomRight, kMetal, cv::FILLED);
	cv::rectangle(canvas, headTopLeft, headBottomRight, kMetalBorder, 3);

	cv::line(canvas, {c.x, headTopLeft.y}, {c.x, c.y - r * 9 / 10}, kMetalBorder, std::max(2, r / 12));
	cv::circle(canvas, {c.x, c.y - r * 9 / 10}, std::max(2, r / 10), kAntennaTip, cv::FILLED);

	const int eyeRadius = std::max(2, r / 6);
	cv::circle(canvas, {c.x - r / 3, c.y - r / 6}, eyeRadius, kLed, cv::FILLED);
	cv::circle(canvas, {c.x + r / 3, c.y - r / 6}, eyeRadius, kLed, cv::FILLED);

	cv::rectangle(canvas, cv::Point(c.x - r / 2, c.y + r / 3), cv::Point(c.x + r / 2, c.y + r / 2), kKeyhole,
		      cv::FILLED);
}

void drawStar(cv::Mat &canvas, const Glyph &g)
{
	const auto [c, r] = g;
	std::vector<cv::Point> points;
	points.reserve(10);
	for (int i = 0; i < 5; ++i) {
		const double outer = (i * 72 - 90) * CV_PI / 180.0;
		const double inner = outer + 36 * CV_PI / 180.0;
		points.emplace_back(static_cast<int>(c.x + r * 0.95 * std::cos(outer)),
				    static_cast<int>(c.y + r * 0.95 * std::sin(outer)));
		points.emplace_back(static_cast<int>(c.x + r * 0.4 * std::cos(inner)),
				    static_cast<int>(c.y + r * 0.4 * std::sin(inner)));
	}

	const std::vector<std::vector<cv::Point>> polygons{points};
	cv::fillPoly(canvas, polygons, kGold);
	cv::polylines(canvas, polygons, true, kGoldBorder, 2);
}

void drawHeart(cv::Mat &canvas, const Glyph &g)
{
	const auto [c, r] = g;
	const int lobe = r * 2 / 3;
	cv::circle(canvas, {c.x - lobe / 2, c.y - lobe / 3}, lobe / 2 + 2, kRed, cv::FILLED);
	cv::circle(canvas, {c.x + lobe / 2, c.y - lobe / 3}, lobe / 2 + 2, kRed, cv::FILLED);

	const std::array<cv::Point, 3> tip{
		cv::Point(c.x - r + r / 6, c.y - r / 6),
		cv::Point(c.x, c.y + r - r / 6),
		cv::Point(c.x + r - r / 6, c.y - r / 6),
	};
	cv::fillConvexPoly(canvas, tip.data(), static_cast<int>(tip.size()), kRed);
}

void drawLock(cv::Mat &canvas, const Glyph &g)
{
	const auto [c, r] = g;
	const int bodyWidth = r;
	const int bodyHeight = r;
	const cv::Point bodyTopLeft(c.x - bodyWidth / 2, c.y);
	const cv::Point bodyBottomRight(bodyTopLeft.x + bodyWidth, bodyTopLeft.y + bodyHeight);
	cv::rectangle(canvas, bodyTopLeft, bodyBottomRight, kLockBody, cv::FILLED);
	cv::rectangle(canvas, bodyTopLeft, bodyBottomRight, kLockBorder, 3);

	cv::ellipse(canvas, {c.x, bodyTopLeft.y}, {bodyWidth / 3, bodyHeight / 2}, 0, 180, 360, kShackle,
		    std::max(3, r / 8));

	const int keyholeY = bodyTopLeft.y + bodyHeight / 3;
	const int slotHalfWidth = std::max(1, r / 12);
	cv::circle(canvas, {c.x, keyholeY}, std::max(2, r / 8), kKeyhole, cv::FILLED);
	cv::rectangle(canvas, cv::Point(c.x - slotHalfWidth, keyholeY),
		      cv::Point(c.x + slotHalfWidth, bodyTopLeft.y + bodyHeight * 2 / 3), kKeyhole, cv::FILLED);
}

void drawPlain(cv::Mat &canvas, const Glyph &g)
{
	cv::circle(canvas, g.center, g.radius, kPlain, cv::FILLED);
}

} // namespace

EmojiStyle parseEmojiStyle(std::string_view key) noexcept
try {
	const std::string normalized = normalizeKey(key);
	for (const auto &[name, style] : kStyleKeys) {
		if (normalized == name) {
			return style;
		}
	}
	return EmojiStyle::Plain;
} catch (const std::bad_alloc &) {
	return EmojiStyle::Plain;
}

std::string_view toString(EmojiStyle style) noexcept
{
	switch (style) {
	case EmojiStyle::Smile:
		return "smile";
	case EmojiStyle::Cool:
		return "cool";
	case EmojiStyle::Monkey:
		return "monkey";
	case EmojiStyle::Robot:
		return "robot";
	case EmojiStyle::Star:
		return "star";
	case EmojiStyle::Heart:
		return "heart";
	case EmojiStyle::Lock:
		return "lock";
	case EmojiStyle::Plain:
	default:
		return "plain";
	}
}

void drawEmojiGlyph(cv::Mat &canvas, EmojiStyle style)
{
	if (canvas.empty()) {
		return;
	}

	const Glyph glyph{cv::Point(canvas.cols / 2, canvas.rows / 2), std::min(canvas.cols, canvas.rows) / 2};
	if (glyph.radius <= 0) {
		return;
	}

	switch (style) {
	case EmojiStyle::Smile:
		drawSmile(canvas, glyph);
		break;
	case EmojiStyle::Cool:
		drawCool(canvas, glyph);
		break;
	case EmojiStyle::Monkey:
		drawMonkey(canvas, glyph);
		break;
	case EmojiStyle::Robot:
		drawRobot(canvas, glyph);
		break;
	case EmojiStyle::Star:
		drawStar(canvas, glyph);
		break;
	case EmojiStyle::Heart:
		drawHeart(canvas, glyph);
		break;
	case EmojiStyle::Lock:
		drawLock(canvas, glyph);
		break;
	case EmojiStyle::Plain:
	default:
		drawPlain(canvas, glyph);
		break;
	}
}

} // namespace PrivacyGuard::Redaction
