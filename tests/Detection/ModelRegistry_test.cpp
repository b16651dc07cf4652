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

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include <PrivacyGuard/Core/Errors.hpp>
#include <PrivacyGuard/Detection/ModelRegistry.hpp>

#include "Detection/FakeBackend.hpp"
#include "NullLogger.hpp"

using namespace PrivacyGuard::Core;
using namespace PrivacyGuard::Detection;

namespace {

FakeBackendScript learned(bool failLoad = false)
{
	FakeBackendScript script;
	script.kind = BackendKind::Learned;
	script.name = "fake-learned";
	script.failLoad = failLoad;
	script.detections = {RawDetection{cv::Rect(10, 10, 20, 20), 0.9f, 0}};
	return script;
}

FakeBackendScript classical(bool failLoad = false)
{
	FakeBackendScript script;
	script.kind = BackendKind::Classical;
	script.name = "fake-classical";
	script.failLoad = failLoad;
	script.detections = {RawDetection{cv::Rect(5, 5, 10, 10), 0.6f, 0}};
	return script;
}

} // namespace

TEST(ModelRegistryTest, NothingLoadsBeforeFirstUse)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	ModelRegistry registry(logger, {makeFakeFactory(learned(), probe)}, {makeFakeFactory(learned(), probe)});

	EXPECT_EQ(probe->constructed.load(), 0);
	EXPECT_EQ(registry.state(Category::Face), CapabilityState::Unloaded);
	EXPECT_FALSE(registry.isReady(Category::Face));
	EXPECT_FALSE(registry.modelsLoaded());
	EXPECT_EQ(probe->constructed.load(), 0);
}

TEST(ModelRegistryTest, PrimaryServesWhenItLoads)
{
	NullLogger logger;
	auto primary = std::make_shared<FakeBackendProbe>();
	auto fallback = std::make_shared<FakeBackendProbe>();
	ModelRegistry registry(logger,
			       {makeFakeFactory(learned(), primary), makeFakeFactory(classical(), fallback)}, {});

	const cv::Mat image(64, 64, CV_8UC3, cv::Scalar::all(0));
	const ServedDetections served = registry.detect(image, Category::Face);

	ASSERT_TRUE(served.servedBy.has_value());
	EXPECT_EQ(*served.servedBy, BackendKind::Learned);
	EXPECT_EQ(served.backendName, "fake-learned");
	EXPECT_EQ(served.detections.size(), 1u);
	EXPECT_EQ(registry.state(Category::Face), CapabilityState::LoadedPrimary);
	EXPECT_TRUE(registry.isReady(Category::Face));
	EXPECT_EQ(fallback->constructed.load(), 0);
}

TEST(ModelRegistryTest, FallsBackWhenPrimaryFailsToLoad)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	ModelRegistry registry(logger, {makeFakeFactory(learned(true), probe), makeFakeFactory(classical(), probe)},
			       {});

	const cv::Mat image(64, 64, CV_8UC3, cv::Scalar::all(0));
	const ServedDetections served = registry.detect(image, Category::Face);

	ASSERT_TRUE(served.servedBy.has_value());
	EXPECT_EQ(*served.servedBy, BackendKind::Classical);
	EXPECT_EQ(registry.state(Category::Face), CapabilityState::LoadedFallback);
	EXPECT_EQ(probe->loads.load(), 2);
}

TEST(ModelRegistryTest, NullFactoryResultCountsAsFailure)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	BackendFactory broken = []() { return std::unique_ptr<IDetectorBackend>(); };
	ModelRegistry registry(logger, {broken, makeFakeFactory(classical(), probe)}, {});

	registry.warmUp();
	EXPECT_EQ(registry.state(Category::Face), CapabilityState::LoadedFallback);
}

TEST(ModelRegistryTest, UnavailableCapabilityYieldsNothingAndNeverRetries)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	ModelRegistry registry(logger, {}, {makeFakeFactory(learned(true), probe), makeFakeFactory(classical(true), probe)});

	const cv::Mat image(64, 64, CV_8UC3, cv::Scalar::all(0));
	for (int i = 0; i < 3; ++i) {
		const ServedDetections served = registry.detect(image, Category::LicensePlate);
		EXPECT_TRUE(served.detections.empty());
		EXPECT_FALSE(served.servedBy.has_value());
	}

	EXPECT_EQ(registry.state(Category::LicensePlate), CapabilityState::Unavailable);
	EXPECT_EQ(probe->loads.load(), 2);
	EXPECT_FALSE(registry.modelsLoaded());
}

TEST(ModelRegistryTest, EmptyChainIsUnavailable)
{
	NullLogger logger;
	ModelRegistry registry(logger, {}, {});

	registry.warmUp();
	EXPECT_EQ(registry.state(Category::Face), CapabilityState::Unavailable);
	EXPECT_EQ(registry.state(Category::LicensePlate), CapabilityState::Unavailable);
}

TEST(ModelRegistryTest, ConcurrentFirstUseLoadsExactlyOnce)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	FakeBackendScript slow = learned();
	slow.loadDelay = std::chrono::milliseconds(50);
	ModelRegistry registry(logger, {makeFakeFactory(slow, probe)}, {});

	const cv::Mat image(64, 64, CV_8UC3, cv::Scalar::all(0));
	std::vector<std::thread> threads;
	std::atomic<int> served = 0;
	for (int i = 0; i < 16; ++i) {
		threads.emplace_back([&]() {
			if (registry.detect(image, Category::Face).servedBy) {
				served.fetch_add(1);
			}
		});
	}
	for (std::thread &t : threads) {
		t.join();
	}

	EXPECT_EQ(probe->constructed.load(), 1);
	EXPECT_EQ(probe->loads.load(), 1);
	EXPECT_EQ(served.load(), 16);
	EXPECT_EQ(probe->detects.load(), 16);
}

TEST(ModelRegistryTest, WarmUpLoadsEveryCapability)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	ModelRegistry registry(logger, {makeFakeFactory(learned(), probe)}, {makeFakeFactory(classical(), probe)});

	registry.warmUp();
	registry.warmUp();

	EXPECT_EQ(probe->loads.load(), 2);
	EXPECT_EQ(registry.state(Category::Face), CapabilityState::LoadedPrimary);
	EXPECT_EQ(registry.state(Category::LicensePlate), CapabilityState::LoadedPrimary);
	EXPECT_TRUE(registry.modelsLoaded());
}

TEST(ModelRegistryTest, InferenceErrorsPropagate)
{
	NullLogger logger;
	auto probe = std::make_shared<FakeBackendProbe>();
	FakeBackendScript failing = learned();
	failing.failDetect = true;
	ModelRegistry registry(logger, {makeFakeFactory(failing, probe)}, {});

	const cv::Mat image(64, 64, CV_8UC3, cv::Scalar::all(0));
	EXPECT_THROW(registry.detect(image, Category::Face), BackendInferenceError);
	EXPECT_EQ(registry.state(Category::Face), CapabilityState::LoadedPrimary);
}

TEST(ModelRegistryTest, StateNamesAreStable)
{
	EXPECT_EQ(toString(CapabilityState::Unloaded), "unloaded");
	EXPECT_EQ(toString(CapabilityState::LoadedPrimary), "loaded-primary");
	EXPECT_EQ(toString(CapabilityState::LoadedFallback), "loaded-fallback");
	EXPECT_EQ(toString(CapabilityState::Unavailable), "unavailable");
	EXPECT_EQ(toString(BackendKind::Learned), "learned");
	EXPECT_EQ(toString(BackendKind::Classical), "classical");
}
