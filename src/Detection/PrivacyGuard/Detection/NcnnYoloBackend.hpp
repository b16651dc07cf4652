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

#include <atomic>
#include <string>
#include <string_view>
#include <vector>

#ifdef PREFIXED_NCNN_HEADERS
#include <ncnn/net.h>
#else
#include <net.h>
#endif

#include <PrivacyGuard/Core/RedactorConfig.hpp>

#include "IDetectorBackend.hpp"

namespace PrivacyGuard::Detection {

/**
 * YOLOv8 detector exported to ncnn. The network takes a letterboxed RGB
 * square normalized to [0, 1] and emits a [4 + numClasses, numAnchors]
 * matrix of (cx, cy, w, h, class scores...).
 */
class NcnnYoloBackend final : public IDetectorBackend {
public:
	NcnnYoloBackend(std::string name, Core::YoloModelConfig config, int numThreads);

	~NcnnYoloBackend() noexcept override = default;

	BackendKind kind() const noexcept override { return BackendKind::Learned; }
	std::string_view name() const noexcept override { return name_; }

	void load() override;
	bool isReady() const noexcept override { return ready_.load(std::memory_order_acquire); }
	std::vector<RawDetection> detect(const cv::Mat &bgr) override;

private:
	const std::string name_;
	const Core::YoloModelConfig config_;
	const int numThreads_;

	ncnn::Net net_;
	std::atomic<bool> ready_ = false;
};

} // namespace PrivacyGuard::Detection
