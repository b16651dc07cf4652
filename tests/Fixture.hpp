/*
 * Privacy Guard - Tests
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
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

// Fixed-seed noise so every run sees the same pixels.
inline cv::Mat makeNoiseImage(int width, int height, std::uint64_t seed = 42)
{
	cv::Mat image(height, width, CV_8UC3);
	cv::RNG rng(seed);
	rng.fill(image, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));
	return image;
}

// One-pixel checkerboard of black and white.
inline cv::Mat makeCheckerboard(int width, int height)
{
	cv::Mat image(height, width, CV_8UC3);
	for (int y = 0; y < height; ++y) {
		for (int x = 0; x < width; ++x) {
			const std::uint8_t v = ((x + y) % 2 == 0) ? 0 : 255;
			image.at<cv::Vec3b>(y, x) = cv::Vec3b(v, v, v);
		}
	}
	return image;
}

inline std::vector<std::uint8_t> encodePng(const cv::Mat &image)
{
	std::vector<std::uint8_t> bytes;
	cv::imencode(".png", image, bytes);
	return bytes;
}

inline double laplacianVariance(const cv::Mat &bgr)
{
	cv::Mat gray, laplacian;
	cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
	cv::Laplacian(gray, laplacian, CV_64F);
	cv::Scalar mean, stddev;
	cv::meanStdDev(laplacian, mean, stddev);
	return stddev[0] * stddev[0];
}

inline int countDistinctColors(const cv::Mat &bgr)
{
	std::vector<std::uint32_t> colors;
	for (int y = 0; y < bgr.rows; ++y) {
		for (int x = 0; x < bgr.cols; ++x) {
			const cv::Vec3b p = bgr.at<cv::Vec3b>(y, x);
			const std::uint32_t key = (std::uint32_t{p[0]} << 16) | (std::uint32_t{p[1]} << 8) | p[2];
			if (std::find(colors.begin(), colors.end(), key) == colors.end()) {
				colors.push_back(key);
			}
		}
	}
	return static_cast<int>(colors.size());
}
