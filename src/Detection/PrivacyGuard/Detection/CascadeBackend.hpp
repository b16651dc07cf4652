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
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/objdetect.hpp>

#include <PrivacyGuard/Core/RedactorConfig.hpp>

#include "IDetectorBackend.hpp"

namespace PrivacyGuard::Detection {

/**
 * Haar cascade detector. Cascades report level weights rather than
 * probabilities; the weights are squashed with a logistic so that the
 * result lives in [0, 1], but their scale has nothing in common with a
 * learned detector's scores.
 */
class CascadeBackend final : public IDetectorBackend {
public:
	CascadeBackend(std::string name, Core::CascadeModelConfig config);

	~CascadeBackend() noexcept override = default;

	BackendKind kind() const noexcept override { return BackendKind::Classical; }
	std::string_view name() const noexcept override { return name_; }

	void load() override;
	bool isReady() const noexcept override { return ready_.load(std::memory_order_acquire); }
	std::vector<RawDetection> detect(const cv::Mat &bgr) override;

	static float levelWeightToScore(double levelWeight) noexcept;

private:
	const std::string name_;
	const Core::CascadeModelConfig config_;

	cv::CascadeClassifier classifier_;
	std::mutex classifierMutex_;
	std::atomic<bool> ready_ = false;
};

} // namespace PrivacyGuard::Detection
