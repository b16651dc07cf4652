/*
 * Privacy Guard - Batch Module
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

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <PrivacyGuard/Core/BoundingBox.hpp>
#include <PrivacyGuard/Core/RedactorConfig.hpp>
#include <PrivacyGuard/Core/Types.hpp>
#include <PrivacyGuard/Detection/DetectionEngine.hpp>
#include <PrivacyGuard/Logger/ILogger.hpp>
#include <PrivacyGuard/Redaction/RegionTransformer.hpp>

namespace PrivacyGuard::Batch {

struct ImageInput {
	std::vector<std::uint8_t> bytes;
	std::string filename;
};

/**
 * @brief Runs decode, detection, redaction and encode over a list of images.
 *
 * Images are handled one after another on the calling thread. Any failure
 * while handling one image is logged and that image is left out of the
 * result; the rest of the batch carries on.
 */
class BatchProcessor {
public:
	BatchProcessor(const Detection::DetectionEngine &engine, const Redaction::RegionTransformer &transformer,
		       const Core::RedactorConfig &config, const Logger::ILogger &logger);

	Core::BatchResult process(std::span<const ImageInput> inputs, const Core::DetectionOptions &options) const;

	/**
	 * Single image, detection included. Throws Core::DecodeError or
	 * Core::EncodeError.
	 */
	Core::ProcessedResult processOne(const ImageInput &input, const Core::DetectionOptions &options) const;

	/**
	 * Redacts caller-supplied boxes without running detection. Disabled
	 * boxes are returned but left unredacted.
	 */
	Core::ProcessedResult redactWithBoxes(const ImageInput &input, const std::vector<Core::BoundingBox> &boxes,
					      const Core::DetectionOptions &options) const;

	/**
	 * Size and extension check. Throws Core::DecodeError.
	 */
	void validate(const ImageInput &input) const;

	static std::string generateId();

private:
	Core::ProcessedResult finish(const ImageInput &input, const cv::Mat &bgr, std::vector<Core::BoundingBox> boxes,
				     const Core::DetectionOptions &options,
				     std::chrono::steady_clock::time_point started) const;

	const Detection::DetectionEngine &engine_;
	const Redaction::RegionTransformer &transformer_;
	const Core::RedactorConfig &config_;
	const Logger::ILogger &logger_;
};

} // namespace PrivacyGuard::Batch
