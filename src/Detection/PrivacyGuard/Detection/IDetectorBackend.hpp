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

#pragma once

#include <string_view>
#include <vector>

#include <opencv2/core.hpp>

namespace PrivacyGuard::Detection {

enum class BackendKind : int {
	Learned = 0,
	Classical = 1,
};

std::string_view toString(BackendKind kind) noexcept;

/**
 * Candidate produced by a backend in original image pixel space, before
 * any thresholding or geometric filtering.
 */
struct RawDetection {
	cv::Rect box;
	float score;
	int classId;
};

/**
 * One concrete detector serving one capability.
 *
 * load() throws Core::BackendLoadError and detect() throws
 * Core::BackendInferenceError. detect() takes a BGR CV_8UC3 image and may be
 * called concurrently once load() has returned.
 */
class IDetectorBackend {
protected:
	IDetectorBackend() = default;

public:
	virtual ~IDetectorBackend() = default;

	virtual BackendKind kind() const noexcept = 0;
	virtual std::string_view name() const noexcept = 0;

	virtual void load() = 0;
	virtual bool isReady() const noexcept = 0;
	virtual std::vector<RawDetection> detect(const cv::Mat &bgr) = 0;

	IDetectorBackend(const IDetectorBackend &) = delete;
	IDetectorBackend &operator=(const IDetectorBackend &) = delete;
	IDetectorBackend(IDetectorBackend &&) = delete;
	IDetectorBackend &operator=(IDetectorBackend &&) = delete;
};

} // namespace PrivacyGuard::Detection
