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

namespace PrivacyGuard::Codec {

// RFC 4648 standard alphabet with '=' padding
inline std::string encodeBase64(std::span<const std::uint8_t> data)
{
	static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

	std::string out;
	out.reserve((data.size() + 2) / 3 * 4);

	std::size_t i = 0;
	for (; i + 3 <= data.size(); i += 3) {
		const std::uint32_t n = (std::uint32_t{data[i]} << 16) | (std::uint32_t{data[i + 1]} << 8) | data[i + 2];
		out.push_back(kAlphabet[(n >> 18) & 0x3F]);
		out.push_back(kAlphabet[(n >> 12) & 0x3F]);
		out.push_back(kAlphabet[(n >> 6) & 0x3F]);
		out.push_back(kAlphabet[n & 0x3F]);
	}

	const std::size_t rest = data.size() - i;
	if (rest == 1) {
		const std::uint32_t n = std::uint32_t{data[i]} << 16;
		out.push_back(kAlphabet[(n >> 18) & 0x3F]);
		out.push_back(kAlphabet[(n >> 12) & 0x3F]);
		out.append("==");
	} else if (rest == 2) {
		const std::uint32_t n = (std::uint32_t{data[i]} << 16) | (std::uint32_t{data[i + 1]} << 8);
		out.push_back(kAlphabet[(n >> 18) & 0x3F]);
		out.push_back(kAlphabet[(n >> 12) & 0x3F]);
		out.push_back(kAlphabet[(n >> 6) & 0x3F]);
		out.push_back('=');
	}

	return out;
}

} // namespace PrivacyGuard::Codec
