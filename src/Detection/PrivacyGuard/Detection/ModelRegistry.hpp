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

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include <PrivacyGuard/Core/BoundingBox.hpp>
#include <PrivacyGuard/Core/RedactorConfig.hpp>
#include <PrivacyGuard/Logger/ILogger.hpp>

#include "IDetectorBackend.hpp"

namespace PrivacyGuard::Detection {

enum class CapabilityState : int {
	Unloaded = 0,
	LoadedPrimary = 1,
	LoadedFallback = 2,
	Unavailable = 3,
};

std::string_view toString(CapabilityState state) noexcept;

using BackendFactory = std::function<std::unique_ptr<IDetectorBackend>()>;

/**
 * Result of one detect() call together with the backend that served it.
 * `servedBy` is empty when the capability is unavailable.
 */
struct ServedDetections {
	std::vector<RawDetection> detections;
	std::optional<BackendKind> servedBy;
	std::string_view backendName;
};

/**
 * Holds at most one live backend per capability.
 *
 * Each capability owns an ordered chain of factories, tried on first use
 * until one of them constructs and loads. The winner is kept for the life
 * of the registry and never reloaded. If the whole chain fails the
 * capability becomes Unavailable and detect() returns nothing for it.
 *
 * First use is serialized per capability by a mutex; once the state has
 * left Unloaded, readers observe it with an acquire load and touch the
 * backend without locking.
 */
class ModelRegistry {
public:
	ModelRegistry(const Logger::ILogger &logger, std::vector<BackendFactory> faceChain,
		      std::vector<BackendFactory> plateChain);

	~ModelRegistry() noexcept = default;

	ModelRegistry(const ModelRegistry &) = delete;
	ModelRegistry &operator=(const ModelRegistry &) = delete;
	ModelRegistry(ModelRegistry &&) = delete;
	ModelRegistry &operator=(ModelRegistry &&) = delete;

	/**
	 * ncnn YOLO primary and Haar cascade fallback for both capabilities.
	 */
	static std::unique_ptr<ModelRegistry> fromConfig(const Core::RedactorConfig &config,
							 const Logger::ILogger &logger);

	/**
	 * Loads the capability if needed and runs its backend.
	 * Propagates Core::BackendInferenceError from the backend.
	 */
	ServedDetections detect(const cv::Mat &bgr, Core::Category category);

	// Neither of these triggers a load.
	bool isReady(Core::Category category) const noexcept;
	CapabilityState state(Core::Category category) const noexcept;

	bool modelsLoaded() const noexcept;

	void warmUp() noexcept;

private:
	struct Slot {
		std::vector<BackendFactory> chain;
		std::unique_ptr<IDetectorBackend> backend;
		std::atomic<CapabilityState> state = CapabilityState::Unloaded;
		std::mutex loadMutex;
	};

	Slot &slotFor(Core::Category category) noexcept;
	const Slot &slotFor(Core::Category category) const noexcept;

	void ensureLoaded(Core::Category category) noexcept;

	const Logger::ILogger &logger_;
	std::array<Slot, Core::kCategoryCount> slots_;
};

} // namespace PrivacyGuard::Detection
