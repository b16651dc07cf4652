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

#include "PrivacyGuard/Batch/BatchProcessor.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <optional>
#include <random>
#include <utility>

#include <fmt/format.h>

#include <PrivacyGuard/Codec/ImageCodec.hpp>
#include <PrivacyGuard/Core/Errors.hpp>

namespace PrivacyGuard::Batch {

namespace {

double millisecondsSince(std::chrono::steady_clock::time_point started) noexcept
{
	return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

std::string extensionOf(std::string_view filename)
{
	const std::size_t dot = filename.rfind('.');
	if (dot == std::string_view::npos) {
		return {};
	}

	std::string extension(filename.substr(dot + 1));
	std::transform(extension.begin(), extension.end(), extension.begin(),
		       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return extension;
}

} // namespace

BatchProcessor::BatchProcessor(const Detection::DetectionEngine &engine,
			       const Redaction::RegionTransformer &transformer, const Core::RedactorConfig &config,
			       const Logger::ILogger &logger)
	: engine_(engine),
	  transformer_(transformer),
	  config_(config),
	  logger_(logger)
{
}

std::string BatchProcessor::generateId()
{
	thread_local std::mt19937 engine{std::random_device{}()};
	std::uniform_int_distribution<std::uint32_t> dist;
	return fmt::format("{:08x}", dist(engine));
}

void BatchProcessor::validate(const ImageInput &input) const
{
	const double sizeMb = static_cast<double>(input.bytes.size()) / (1024.0 * 1024.0);
	if (sizeMb > static_cast<double>(config_.maxFileSizeMb)) {
		throw Core::DecodeError(fmt::format("FileTooLarge(BatchProcessor::validate):{:.1f}MB > {}MB", sizeMb,
						    config_.maxFileSizeMb));
	}

	const std::string extension = extensionOf(input.filename);
	if (std::find(config_.allowedExtensions.begin(), config_.allowedExtensions.end(), extension) ==
	    config_.allowedExtensions.end()) {
		throw Core::DecodeError(fmt::format("UnsupportedExtension(BatchProcessor::validate):'{}'", extension));
	}
}

Core::ProcessedResult BatchProcessor::finish(const ImageInput &input, const cv::Mat &bgr,
					     std::vector<Core::BoundingBox> boxes,
					     const Core::DetectionOptions &options,
					     std::chrono::steady_clock::time_point started) const
{
	const cv::Mat redacted = transformer_.apply(bgr, boxes, options);

	Core::ProcessedResult result;
	result.id = generateId();
	result.originalFilename = input.filename;
	result.format = config_.outputFormat;
	result.encodedImage = Codec::encodeImage(redacted, config_.outputFormat);
	result.dataUri = Codec::toDataUri(result.encodedImage, config_.outputFormat);
	result.boxes = std::move(boxes);
	result.elapsedMs = millisecondsSince(started);
	return result;
}

Core::ProcessedResult BatchProcessor::processOne(const ImageInput &input,
						 const Core::DetectionOptions &options) const
{
	const auto started = std::chrono::steady_clock::now();
	const Core::DetectionOptions opts = options.clamped();

	validate(input);
	const Codec::DecodedImage image = Codec::decodeImage(input.bytes);

	std::vector<Core::BoundingBox> boxes =
		engine_.detect(image.pixels, opts.detectFaces, opts.detectPlates, opts.sensitivity);

	return finish(input, image.pixels, std::move(boxes), opts, started);
}

Core::ProcessedResult BatchProcessor::redactWithBoxes(const ImageInput &input,
						      const std::vector<Core::BoundingBox> &boxes,
						      const Core::DetectionOptions &options) const
{
	const auto started = std::chrono::steady_clock::now();
	const Core::DetectionOptions opts = options.clamped();

	validate(input);
	const Codec::DecodedImage image = Codec::decodeImage(input.bytes);

	std::vector<Core::BoundingBox> clamped;
	clamped.reserve(boxes.size());
	for (const Core::BoundingBox &box : boxes) {
		const std::optional<Core::BoundingBox> inside = Core::clampToImage(box, image.width(), image.height());
		if (inside) {
			clamped.push_back(*inside);
		} else {
			const std::string rect = fmt::format("{},{},{}x{}", box.x, box.y, box.width, box.height);
			logger_.debug("BoxOutsideImage", {{"filename", input.filename}, {"box", rect}});
		}
	}

	return finish(input, image.pixels, std::move(clamped), opts, started);
}

Core::BatchResult BatchProcessor::process(std::span<const ImageInput> inputs,
					  const Core::DetectionOptions &options) const
{
	const auto started = std::chrono::steady_clock::now();

	if (inputs.size() > config_.maxBatchSize) {
		logger_.warn("Batch of {} images exceeds the limit of {}, extra images are ignored", inputs.size(),
			     config_.maxBatchSize);
		inputs = inputs.first(config_.maxBatchSize);
	}

	Core::BatchResult batch;
	batch.results.reserve(inputs.size());

	for (const ImageInput &input : inputs) {
		try {
			Core::ProcessedResult result = processOne(input, options);
			batch.totalDetections += result.boxes.size();

			const std::string boxCount = std::to_string(result.boxes.size());
			const std::string elapsed = fmt::format("{:.1f}", result.elapsedMs);
			logger_.debug("ImageProcessed", {{"id", result.id},
							 {"filename", input.filename},
							 {"detections", boxCount},
							 {"ms", elapsed}});

			batch.results.push_back(std::move(result));
		} catch (const std::exception &e) {
			logger_.warn("ImageSkipped", {{"filename", input.filename}, {"reason", e.what()}});
		}
	}

	batch.totalMs = millisecondsSince(started);
	return batch;
}

} // namespace PrivacyGuard::Batch
