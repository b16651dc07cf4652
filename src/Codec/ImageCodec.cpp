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

#include "PrivacyGuard/Codec/ImageCodec.hpp"

#include <fmt/format.h>
#include <opencv2/imgcodecs.hpp>

#include <PrivacyGuard/Core/Errors.hpp>

#include "PrivacyGuard/Codec/Base64.hpp"

namespace PrivacyGuard::Codec {

namespace {

constexpr int kLossyQuality = 95;

} // namespace

DecodedImage decodeImage(std::span<const std::uint8_t> bytes)
{
	if (bytes.empty()) {
		throw Core::DecodeError("EmptyInput(decodeImage)");
	}

	// imdecode only reads from the buffer
	const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<std::uint8_t *>(bytes.data()));

	cv::Mat pixels;
	try {
		pixels = cv::imdecode(raw, cv::IMREAD_COLOR);
	} catch (const cv::Exception &e) {
		throw Core::DecodeError(fmt::format("DecoderError(decodeImage):{}", e.what()));
	}

	if (pixels.empty()) {
		throw Core::DecodeError(fmt::format("UnrecognizedImage(decodeImage):{} bytes", bytes.size()));
	}
	if (pixels.type() != CV_8UC3) {
		throw Core::DecodeError(fmt::format("UnexpectedPixelType(decodeImage):{}", pixels.type()));
	}

	return DecodedImage{pixels};
}

std::vector<std::uint8_t> encodeImage(const cv::Mat &bgr, Core::OutputFormat format)
{
	if (bgr.empty() || bgr.type() != CV_8UC3) {
		throw Core::EncodeError("InvalidImage(encodeImage)");
	}

	std::string extension;
	std::vector<int> params;
	switch (format) {
	case Core::OutputFormat::Jpeg:
		extension = ".jpg";
		params = {cv::IMWRITE_JPEG_QUALITY, kLossyQuality};
		break;
	case Core::OutputFormat::Webp:
		extension = ".webp";
		params = {cv::IMWRITE_WEBP_QUALITY, kLossyQuality};
		break;
	case Core::OutputFormat::Png:
	default:
		extension = ".png";
		break;
	}

	std::vector<std::uint8_t> encoded;
	bool ok = false;
	try {
		ok = cv::imencode(extension, bgr, encoded, params);
	} catch (const cv::Exception &e) {
		throw Core::EncodeError(fmt::format("EncoderError(encodeImage):{}:{}", extension, e.what()));
	}

	if (!ok || encoded.empty()) {
		throw Core::EncodeError(fmt::format("EncoderError(encodeImage):{}", extension));
	}
	return encoded;
}

std::string_view mimeType(Core::OutputFormat format) noexcept
{
	switch (format) {
	case Core::OutputFormat::Jpeg:
		return "image/jpeg";
	case Core::OutputFormat::Webp:
		return "image/webp";
	case Core::OutputFormat::Png:
	default:
		return "image/png";
	}
}

std::string toDataUri(std::span<const std::uint8_t> encoded, Core::OutputFormat format)
{
	return fmt::format("data:{};base64,{}", mimeType(format), encodeBase64(encoded));
}

} // namespace PrivacyGuard::Codec
