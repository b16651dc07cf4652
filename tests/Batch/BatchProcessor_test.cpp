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

#include <gtest/gtest.h>

#include <cctype>
#include <limits>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <PrivacyGuard/Batch/BatchProcessor.hpp>
#include <PrivacyGuard/Codec/ImageCodec.hpp>
#include <PrivacyGuard/Core/Errors.hpp>
#include <PrivacyGuard/Core/RedactorConfig.hpp>
#include <PrivacyGuard/Detection/DetectionEngine.hpp>
#include <PrivacyGuard/Detection/ModelRegistry.hpp>
#include <PrivacyGuard/Redaction/RegionTransformer.hpp>

#include "Detection/FakeBackend.hpp"
#include "Fixture.hpp"
#include "NullLogger.hpp"

using namespace PrivacyGuard;

namespace {

// One face per image at a fixed spot; no plate backend at all.
class BatchProcessorTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		FakeBackendScript script;
		script.detections = {Detection::RawDetection{cv::Rect(20, 20, 40, 40), 0.95f, 0}};
		registry = std::make_unique<Detection::ModelRegistry>(
			logger, std::vector<Detection::BackendFactory>{makeFakeFactory(script, probe)},
			std::vector<Detection::BackendFactory>{});
		rebuild();
	}

	void rebuild()
	{
		engine = std::make_unique<Detection::DetectionEngine>(*registry, config, logger);
		processor = std::make_unique<Batch::BatchProcessor>(*engine, transformer, config, logger);
	}

	Batch::ImageInput pngInput(const std::string &name, std::uint64_t seed = 1) const
	{
		return Batch::ImageInput{encodePng(makeNoiseImage(120, 100, seed)), name};
	}

	NullLogger logger;
	Core::RedactorConfig config;
	std::shared_ptr<FakeBackendProbe> probe = std::make_shared<FakeBackendProbe>();
	std::unique_ptr<Detection::ModelRegistry> registry;
	std::unique_ptr<Detection::DetectionEngine> engine;
	const Redaction::RegionTransformer transformer{logger};
	std::unique_ptr<Batch::BatchProcessor> processor;
};

} // namespace

TEST_F(BatchProcessorTest, CorruptImageIsSkippedAndOthersSucceed)
{
	std::vector<Batch::ImageInput> inputs{
		pngInput("a.png", 1),
		Batch::ImageInput{{'n', 'o', 'p', 'e'}, "broken.png"},
		pngInput("b.png", 2),
		pngInput("c.png", 3),
	};

	const Core::BatchResult batch = processor->process(inputs, Core::DetectionOptions{});

	ASSERT_EQ(batch.results.size(), 3u);
	EXPECT_EQ(batch.results[0].originalFilename, "a.png");
	EXPECT_EQ(batch.results[1].originalFilename, "b.png");
	EXPECT_EQ(batch.results[2].originalFilename, "c.png");
	EXPECT_EQ(batch.totalDetections, 3u);
	EXPECT_GE(batch.totalMs, 0.0);
}

TEST_F(BatchProcessorTest, ResultsCarryEncodedImageAndMetadata)
{
	const std::vector<Batch::ImageInput> inputs{pngInput("photo.PNG")};

	const Core::BatchResult batch = processor->process(inputs, Core::DetectionOptions{});

	ASSERT_EQ(batch.results.size(), 1u);
	const Core::ProcessedResult &result = batch.results[0];

	ASSERT_EQ(result.id.size(), 8u);
	for (char c : result.id) {
		EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)) && !std::isupper(static_cast<unsigned char>(c)));
	}
	EXPECT_EQ(result.format, Core::OutputFormat::Png);
	EXPECT_EQ(result.dataUri.rfind("data:image/png;base64,", 0), 0u);
	EXPECT_GE(result.elapsedMs, 0.0);

	ASSERT_EQ(result.boxes.size(), 1u);
	EXPECT_EQ(result.boxes[0].category, Core::Category::Face);

	const Codec::DecodedImage decoded = Codec::decodeImage(result.encodedImage);
	EXPECT_EQ(decoded.width(), 120);
	EXPECT_EQ(decoded.height(), 100);

	// redacted region differs from the source, the rest is lossless
	const cv::Mat source = makeNoiseImage(120, 100, 1);
	EXPECT_GT(cv::norm(decoded.pixels(result.boxes[0].toRect()), source(result.boxes[0].toRect()), cv::NORM_L1),
		  0.0);
	EXPECT_EQ(cv::norm(decoded.pixels(cv::Rect(100, 0, 20, 20)), source(cv::Rect(100, 0, 20, 20)), cv::NORM_INF),
		  0.0);
}

TEST_F(BatchProcessorTest, ValidationRejectsOversizeAndUnknownExtensions)
{
	EXPECT_THROW(processor->validate(pngInput("notes.txt")), Core::DecodeError);
	EXPECT_THROW(processor->validate(pngInput("no-extension")), Core::DecodeError);
	EXPECT_NO_THROW(processor->validate(pngInput("ok.jpeg")));

	config.maxFileSizeMb = 0;
	rebuild();
	EXPECT_THROW(processor->validate(pngInput("big.png")), Core::DecodeError);

	const std::vector<Batch::ImageInput> inputs{pngInput("big.png")};
	EXPECT_TRUE(processor->process(inputs, Core::DetectionOptions{}).results.empty());
}

TEST_F(BatchProcessorTest, HugeSizeLimitDoesNotWrapAround)
{
	config.maxFileSizeMb = std::numeric_limits<std::size_t>::max();
	rebuild();
	EXPECT_NO_THROW(processor->validate(pngInput("ok.png")));
}

TEST_F(BatchProcessorTest, OversizeBatchIsTruncated)
{
	config.maxBatchSize = 2;
	rebuild();

	const std::vector<Batch::ImageInput> inputs{pngInput("a.png"), pngInput("b.png"), pngInput("c.png")};
	const Core::BatchResult batch = processor->process(inputs, Core::DetectionOptions{});

	ASSERT_EQ(batch.results.size(), 2u);
	EXPECT_EQ(batch.results[1].originalFilename, "b.png");
}

TEST_F(BatchProcessorTest, DetectionTogglesAreHonoured)
{
	Core::DetectionOptions options;
	options.detectFaces = false;

	const std::vector<Batch::ImageInput> inputs{pngInput("a.png")};
	const Core::BatchResult batch = processor->process(inputs, options);

	ASSERT_EQ(batch.results.size(), 1u);
	EXPECT_TRUE(batch.results[0].boxes.empty());
	EXPECT_EQ(batch.totalDetections, 0u);
	EXPECT_EQ(probe->detects.load(), 0);
}

TEST_F(BatchProcessorTest, OutputFormatFollowsConfig)
{
	config.outputFormat = Core::OutputFormat::Jpeg;
	rebuild();

	const Core::ProcessedResult result = processor->processOne(pngInput("a.png"), Core::DetectionOptions{});
	EXPECT_EQ(result.format, Core::OutputFormat::Jpeg);
	EXPECT_EQ(result.dataUri.rfind("data:image/jpeg;base64,", 0), 0u);
}

TEST_F(BatchProcessorTest, ProcessOneThrowsOnCorruptInput)
{
	EXPECT_THROW(processor->processOne(Batch::ImageInput{{1, 2, 3}, "x.png"}, Core::DetectionOptions{}),
		     Core::DecodeError);
}

TEST_F(BatchProcessorTest, RedactWithBoxesSkipsDetectionAndDisabledBoxes)
{
	const Batch::ImageInput input = pngInput("edit.png");
	const cv::Mat source = makeNoiseImage(120, 100, 1);

	const std::vector<Core::BoundingBox> boxes{
		{0, 0, 40, 40, 1.0f, Core::Category::Face, true},
		{60, 50, 40, 40, 1.0f, Core::Category::LicensePlate, false},
		{500, 500, 10, 10, 1.0f, Core::Category::Face, true},
	};

	const Core::ProcessedResult result = processor->redactWithBoxes(input, boxes, Core::DetectionOptions{});

	EXPECT_EQ(probe->detects.load(), 0);
	ASSERT_EQ(result.boxes.size(), 2u);
	EXPECT_TRUE(result.boxes[0].enabled);
	EXPECT_FALSE(result.boxes[1].enabled);

	const cv::Mat decoded = Codec::decodeImage(result.encodedImage).pixels;
	EXPECT_GT(cv::norm(decoded(cv::Rect(0, 0, 40, 40)), source(cv::Rect(0, 0, 40, 40)), cv::NORM_L1), 0.0);
	EXPECT_EQ(cv::norm(decoded(cv::Rect(60, 50, 40, 40)), source(cv::Rect(60, 50, 40, 40)), cv::NORM_INF), 0.0);
}

TEST(BatchProcessorIdTest, IdsAreShortLowercaseHex)
{
	std::set<std::string> seen;
	for (int i = 0; i < 200; ++i) {
		const std::string id = Batch::BatchProcessor::generateId();
		ASSERT_EQ(id.size(), 8u);
		EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
		seen.insert(id);
	}
	EXPECT_GT(seen.size(), 190u);
}
