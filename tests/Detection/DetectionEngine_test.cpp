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

#include <cstddef>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include <PrivacyGuard/Core/RedactorConfig.hpp>
#include <PrivacyGuard/Detection/DetectionEngine.hpp>
#include <PrivacyGuard/Detection/ModelRegistry.hpp>

#include "Detection/FakeBackend.hpp"
#include "NullLogger.hpp"

using namespace PrivacyGuard::Core;
using namespace PrivacyGuard::Detection;

namespace {

FakeBackendScript scripted(BackendKind kind, std::vector<RawDetection> detections)
{
	FakeBackendScript script;
	script.kind = kind;
	script.detections = std::move(detections);
	return script;
}

} // namespace

TEST(DetectionEngineTest, FaceBoxesArePadded)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	ModelRegistry registry(
		logger, {makeFakeFactory(scripted(BackendKind::Learned, {{cv::Rect(10, 10, 40, 40), 0.9f, 0}}), probe)},
		{});
	const DetectionEngine engine(registry, RedactorConfig{}, logger);

	const cv::Mat image(100, 100, CV_8UC3, cv::Scalar::all(0));
	const std::vector<BoundingBox> boxes = engine.detect(image, true, false, 60);

	ASSERT_EQ(boxes.size(), 1u);
	EXPECT_EQ(boxes[0].x, 6);
	EXPECT_EQ(boxes[0].y, 6);
	EXPECT_EQ(boxes[0].width, 48);
	EXPECT_EQ(boxes[0].height, 48);
	EXPECT_EQ(boxes[0].category, Category::Face);
	EXPECT_FLOAT_EQ(boxes[0].confidence, 0.9f);
	EXPECT_TRUE(boxes[0].enabled);
}

TEST(DetectionEngineTest, FaceBoxesAreClampedToImage)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	ModelRegistry registry(
		logger, {makeFakeFactory(scripted(BackendKind::Learned, {{cv::Rect(-20, 70, 60, 60), 0.9f, 0}}), probe)},
		{});
	const DetectionEngine engine(registry, RedactorConfig{}, logger);

	const cv::Mat image(100, 100, CV_8UC3, cv::Scalar::all(0));
	const std::vector<BoundingBox> boxes = engine.detect(image, true, false, 60);

	ASSERT_EQ(boxes.size(), 1u);
	EXPECT_GE(boxes[0].x, 0);
	EXPECT_GE(boxes[0].y, 0);
	EXPECT_LE(boxes[0].x + boxes[0].width, 100);
	EXPECT_LE(boxes[0].y + boxes[0].height, 100);
}

TEST(DetectionEngineTest, ThresholdFollowsServingBackendKind)
{
	NullLogger logger;
	const std::vector<RawDetection> detections{{cv::Rect(10, 10, 40, 40), 0.75f, 0}};
	const cv::Mat image(100, 100, CV_8UC3, cv::Scalar::all(0));

	auto learnedProbe = std::make_shared<FakeBackendProbe>();
	ModelRegistry learnedRegistry(
		logger, {makeFakeFactory(scripted(BackendKind::Learned, detections), learnedProbe)}, {});
	const DetectionEngine learnedEngine(learnedRegistry, RedactorConfig{}, logger);

	auto classicalProbe = std::make_shared<FakeBackendProbe>();
	ModelRegistry classicalRegistry(
		logger, {makeFakeFactory(scripted(BackendKind::Classical, detections), classicalProbe)}, {});
	const DetectionEngine classicalEngine(classicalRegistry, RedactorConfig{}, logger);

	// 0.75 clears the learned ceiling of 0.70 but not the classical one of 0.85
	EXPECT_EQ(learnedEngine.detect(image, true, false, 0).size(), 1u);
	EXPECT_TRUE(classicalEngine.detect(image, true, false, 0).empty());
}

TEST(DetectionEngineTest, HigherSensitivityNeverFindsLess)
{
	NullLogger logger;
	std::vector<RawDetection> detections;
	for (int i = 0; i < 10; ++i) {
		detections.push_back({cv::Rect(i * 20, 10, 15, 15), 0.05f + 0.1f * i, 0});
	}
	auto probe = std::make_shared<FakeBackendProbe>();
	ModelRegistry registry(logger, {makeFakeFactory(scripted(BackendKind::Learned, detections), probe)}, {});
	const DetectionEngine engine(registry, RedactorConfig{}, logger);

	const cv::Mat image(200, 200, CV_8UC3, cv::Scalar::all(0));
	std::size_t previous = 0;
	for (int s = 0; s <= 100; s += 10) {
		const std::size_t count = engine.detect(image, true, false, s).size();
		EXPECT_GE(count, previous) << "sensitivity " << s;
		previous = count;
	}
	EXPECT_GE(engine.detect(image, true, false, 100).size(), engine.detect(image, true, false, 0).size());
}

TEST(DetectionEngineTest, PlateFailureLeavesFacesIntact)
{
	NullLogger logger;
	auto faceProbe = std::make_shared<FakeBackendProbe>();
	auto plateProbe = std::make_shared<FakeBackendProbe>();
	FakeBackendScript broken = scripted(BackendKind::Learned, {});
	broken.failDetect = true;
	ModelRegistry registry(
		logger, {makeFakeFactory(scripted(BackendKind::Learned, {{cv::Rect(10, 10, 40, 40), 0.9f, 0}}), faceProbe)},
		{makeFakeFactory(broken, plateProbe)});
	const DetectionEngine engine(registry, RedactorConfig{}, logger);

	const cv::Mat image(100, 100, CV_8UC3, cv::Scalar::all(0));
	const std::vector<BoundingBox> boxes = engine.detect(image, true, true, 60);

	ASSERT_EQ(boxes.size(), 1u);
	EXPECT_EQ(boxes[0].category, Category::Face);
	EXPECT_EQ(plateProbe->detects.load(), 1);
}

TEST(DetectionEngineTest, FaceFailureLeavesPlatesIntact)
{
	NullLogger logger;
	auto faceProbe = std::make_shared<FakeBackendProbe>();
	auto plateProbe = std::make_shared<FakeBackendProbe>();
	FakeBackendScript broken = scripted(BackendKind::Learned, {});
	broken.failDetect = true;
	ModelRegistry registry(
		logger, {makeFakeFactory(broken, faceProbe)},
		{makeFakeFactory(scripted(BackendKind::Learned, {{cv::Rect(400, 700, 200, 50), 0.9f, 0}}), plateProbe)});
	const DetectionEngine engine(registry, RedactorConfig{}, logger);

	const cv::Mat image(1000, 1000, CV_8UC3, cv::Scalar::all(0));
	const std::vector<BoundingBox> boxes = engine.detect(image, true, true, 60);

	ASSERT_EQ(boxes.size(), 1u);
	EXPECT_EQ(boxes[0].category, Category::LicensePlate);
	EXPECT_EQ(boxes[0].width, 180);
	EXPECT_EQ(boxes[0].height, 46);
}

TEST(DetectionEngineTest, PlatesPassThroughGeometricFilter)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	ModelRegistry registry(logger, {},
			       {makeFakeFactory(scripted(BackendKind::Learned,
							 {
								 {cv::Rect(400, 700, 200, 50), 0.9f, 0},
								 {cv::Rect(100, 100, 300, 300), 0.9f, 0},
								 {cv::Rect(400, 20, 200, 50), 0.9f, 0},
							 }),
						probe)});
	const DetectionEngine engine(registry, RedactorConfig{}, logger);

	const cv::Mat image(1000, 1000, CV_8UC3, cv::Scalar::all(0));
	const std::vector<BoundingBox> boxes = engine.detect(image, false, true, 60);

	ASSERT_EQ(boxes.size(), 1u);
	EXPECT_EQ(boxes[0].x, 410);
	EXPECT_EQ(boxes[0].y, 702);
}

TEST(DetectionEngineTest, DisabledCapabilitiesAreNotQueried)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	ModelRegistry registry(logger, {makeFakeFactory(scripted(BackendKind::Learned, {}), probe)},
			       {makeFakeFactory(scripted(BackendKind::Learned, {}), probe)});
	const DetectionEngine engine(registry, RedactorConfig{}, logger);

	const cv::Mat image(100, 100, CV_8UC3, cv::Scalar::all(0));
	EXPECT_TRUE(engine.detect(image, false, false, 60).empty());
	EXPECT_EQ(probe->constructed.load(), 0);
	EXPECT_EQ(registry.state(Category::Face), CapabilityState::Unloaded);
}

TEST(DetectionEngineTest, UnavailableCapabilityYieldsNoBoxes)
{
	NullLogger logger;
	ModelRegistry registry(logger, {}, {});
	const DetectionEngine engine(registry, RedactorConfig{}, logger);

	const cv::Mat image(100, 100, CV_8UC3, cv::Scalar::all(0));
	EXPECT_TRUE(engine.detect(image, true, true, 100).empty());
}
