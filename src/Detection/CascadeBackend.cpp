/*
 * Privacy Guard - Detection Module
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

#include "PrivacyGuard/Detection/CascadeBackend.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>
#include <opencv2/imgproc.hpp>

#include <PrivacyGuard/Core/Errors.hpp>

namespace PrivacyGuard::Detection {

CascadeBackend::CascadeBackend(std::string name, Core::CascadeModelConfig config)
	: name_(std::move(name)),
	  config_(std::move(config))
{
}

void CascadeBackend::load()
{
	std::lock_guard<std::mutex> lock(classifierMutex_);

	bool loaded = false;
	try {
		loaded = classifier_.load(config_.path);
	} catch (const cv::Exception &e) {
		throw Core::BackendLoadError(fmt::format("CascadeLoadError(CascadeBackend::load):{}:{}", config_.path,
							 e.what()));
	}

	if (!loaded || classifier_.empty()) {
		throw Core::BackendLoadError(fmt::format("CascadeLoadError(CascadeBackend::load):{}", config_.path));
	}

	ready_.store(true, std::memory_order_release);
}

std::vector<RawDetection> CascadeBackend::detect(const cv::Mat &bgr)
{
	if (!isReady()) {
		throw Core::BackendInferenceError("NotLoaded(CascadeBackend::detect)");
	}
	if (bgr.empty() || bgr.type() != CV_8UC3) {
		throw Core::BackendInferenceError("InvalidImage(CascadeBackend::detect)");
	}

	std::vector<cv::Rect> objects;
	std::vector<int> rejectLevels;
	std::vector<double> levelWeights;

	try {
		cv::Mat gray;
		cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
		cv::equalizeHist(gray, gray);

		// CascadeClassifier keeps per-call scratch state
		std::lock_guard<std::mutex> lock(classifierMutex_);
		classifier_.detectMultiScale(gray, objects, rejectLevels, levelWeights, config_.scaleFactor,
					     config_.minNeighbors, 0, cv::Size(config_.minSizePx, config_.minSizePx),
					     cv::Size(), true);
	} catch (const cv::Exception &e) {
		throw Core::BackendInferenceError(fmt::format("CascadeError(CascadeBackend::detect):{}", e.what()));
	}

	std::vector<RawDetection> detections;
	detections.reserve(objects.size());
	for (std::size_t i = 0; i < objects.size(); ++i) {
		const double weight = i < levelWeights.size() ? levelWeights[i] : 0.0;
		detections.push_back(RawDetection{objects[i], levelWeightToScore(weight), 0});
	}
	return detections;
}

float CascadeBackend::levelWeightToScore(double levelWeight) noexcept
{
	return static_cast<float>(1.0 / (1.0 + std::exp(-levelWeight)));
}

} // namespace PrivacyGuard::Detection
