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

#include "PrivacyGuard/Detection/NcnnYoloBackend.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <utility>

#include <fmt/format.h>
#include <opencv2/dnn.hpp>

#include <PrivacyGuard/Core/Errors.hpp>

namespace PrivacyGuard::Detection {

namespace {

// Candidates below this score never reach any calibrated threshold.
constexpr float kCandidateScore = 0.05f;
constexpr float kLetterboxValue = 114.0f;

} // namespace

NcnnYoloBackend::NcnnYoloBackend(std::string name, Core::YoloModelConfig config, int numThreads)
	: name_(std::move(name)),
	  config_(std::move(config)),
	  numThreads_(numThreads)
{
}

void NcnnYoloBackend::load()
{
	if (!std::filesystem::exists(config_.paramPath)) {
		throw Core::BackendLoadError(
			fmt::format("ParamFileNotFound(NcnnYoloBackend::load):{}", config_.paramPath));
	}
	if (!std::filesystem::exists(config_.binPath)) {
		throw Core::BackendLoadError(fmt::format("BinFileNotFound(NcnnYoloBackend::load):{}", config_.binPath));
	}

	net_.opt.num_threads = numThreads_;
	net_.opt.use_vulkan_compute = false;
	net_.opt.use_local_pool_allocator = true;

	if (net_.load_param(config_.paramPath.c_str()) != 0) {
		throw Core::BackendLoadError(fmt::format("ParamLoadError(NcnnYoloBackend::load):{}", config_.paramPath));
	}
	if (net_.load_model(config_.binPath.c_str()) != 0) {
		throw Core::BackendLoadError(fmt::format("ModelLoadError(NcnnYoloBackend::load):{}", config_.binPath));
	}

	ready_.store(true, std::memory_order_release);
}

std::vector<RawDetection> NcnnYoloBackend::detect(const cv::Mat &bgr)
{
	if (!isReady()) {
		throw Core::BackendInferenceError("NotLoaded(NcnnYoloBackend::detect)");
	}
	if (bgr.empty() || bgr.type() != CV_8UC3) {
		throw Core::BackendInferenceError("InvalidImage(NcnnYoloBackend::detect)");
	}

	const int width = bgr.cols;
	const int height = bgr.rows;
	const int inputSize = config_.inputSize;

	const float scale = std::min(static_cast<float>(inputSize) / width, static_cast<float>(inputSize) / height);
	const int resizedWidth = std::max(1, static_cast<int>(std::round(width * scale)));
	const int resizedHeight = std::max(1, static_cast<int>(std::round(height * scale)));
	const int padLeft = (inputSize - resizedWidth) / 2;
	const int padTop = (inputSize - resizedHeight) / 2;

	ncnn::Mat resized = ncnn::Mat::from_pixels_resize(bgr.data, ncnn::Mat::PIXEL_BGR2RGB, width, height,
							  static_cast<int>(bgr.step[0]), resizedWidth, resizedHeight);

	ncnn::Mat input;
	ncnn::copy_make_border(resized, input, padTop, inputSize - resizedHeight - padTop, padLeft,
			       inputSize - resizedWidth - padLeft, ncnn::BORDER_CONSTANT, kLetterboxValue);

	const float normVals[3] = {1.0f / 255.0f, 1.0f / 255.0f, 1.0f / 255.0f};
	input.substract_mean_normalize(nullptr, normVals);

	ncnn::Extractor ex = net_.create_extractor();
	if (ex.input(config_.inputBlob.c_str(), input) != 0) {
		throw Core::BackendInferenceError(
			fmt::format("InputError(NcnnYoloBackend::detect):{}:{}", name_, config_.inputBlob));
	}

	ncnn::Mat output;
	if (ex.extract(config_.outputBlob.c_str(), output) != 0 || output.empty()) {
		throw Core::BackendInferenceError(
			fmt::format("ExtractError(NcnnYoloBackend::detect):{}:{}", name_, config_.outputBlob));
	}

	// Exports differ in whether anchors run along w or h; the channel axis is the short one.
	const bool anchorsAlongWidth = output.w >= output.h;
	const int channels = anchorsAlongWidth ? output.h : output.w;
	const int numAnchors = anchorsAlongWidth ? output.w : output.h;
	const int numClasses = channels - 4;
	if (numClasses <= 0) {
		throw Core::BackendInferenceError(
			fmt::format("UnexpectedOutputShape(NcnnYoloBackend::detect):{}x{}", output.w, output.h));
	}

	auto at = [&](int channel, int anchor) -> float {
		return anchorsAlongWidth ? output.row(channel)[anchor] : output.row(anchor)[channel];
	};

	std::vector<cv::Rect> boxes;
	std::vector<float> scores;
	std::vector<int> classIds;

	for (int i = 0; i < numAnchors; ++i) {
		int bestClass = -1;
		float bestScore = 0.0f;
		for (int c = 0; c < numClasses; ++c) {
			const float score = at(4 + c, i);
			if (score > bestScore) {
				bestScore = score;
				bestClass = c;
			}
		}

		if (bestScore < kCandidateScore) {
			continue;
		}
		if (!config_.classIds.empty() &&
		    std::find(config_.classIds.begin(), config_.classIds.end(), bestClass) == config_.classIds.end()) {
			continue;
		}

		const float cx = at(0, i);
		const float cy = at(1, i);
		const float w = at(2, i);
		const float h = at(3, i);

		const float x1 = (cx - w / 2.0f - padLeft) / scale;
		const float y1 = (cy - h / 2.0f - padTop) / scale;
		const float x2 = (cx + w / 2.0f - padLeft) / scale;
		const float y2 = (cy + h / 2.0f - padTop) / scale;

		boxes.emplace_back(static_cast<int>(std::floor(x1)), static_cast<int>(std::floor(y1)),
				   static_cast<int>(std::round(x2 - x1)), static_cast<int>(std::round(y2 - y1)));
		scores.push_back(bestScore);
		classIds.push_back(bestClass);
	}

	std::vector<int> keep;
	cv::dnn::NMSBoxes(boxes, scores, kCandidateScore, config_.nmsThreshold, keep);

	std::vector<RawDetection> detections;
	detections.reserve(keep.size());
	for (int idx : keep) {
		detections.push_back(RawDetection{boxes[idx], scores[idx], classIds[idx]});
	}
	return detections;
}

} // namespace PrivacyGuard::Detection
