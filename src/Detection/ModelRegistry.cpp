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

#include "PrivacyGuard/Detection/ModelRegistry.hpp"

#include <exception>
#include <string>
#include <utility>

#include <PrivacyGuard/Core/Errors.hpp>

#include "PrivacyGuard/Detection/CascadeBackend.hpp"
#include "PrivacyGuard/Detection/NcnnYoloBackend.hpp"

namespace PrivacyGuard::Detection {

std::string_view toString(BackendKind kind) noexcept
{
	switch (kind) {
	case BackendKind::Learned:
		return "learned";
	case BackendKind::Classical:
		return "classical";
	default:
		return "unknown";
	}
}

std::string_view toString(CapabilityState state) noexcept
{
	switch (state) {
	case CapabilityState::Unloaded:
		return "unloaded";
	case CapabilityState::LoadedPrimary:
		return "loaded-primary";
	case CapabilityState::LoadedFallback:
		return "loaded-fallback";
	case CapabilityState::Unavailable:
		return "unavailable";
	default:
		return "unknown";
	}
}

ModelRegistry::ModelRegistry(const Logger::ILogger &logger, std::vector<BackendFactory> faceChain,
			     std::vector<BackendFactory> plateChain)
	: logger_(logger)
{
	slotFor(Core::Category::Face).chain = std::move(faceChain);
	slotFor(Core::Category::LicensePlate).chain = std::move(plateChain);
}

std::unique_ptr<ModelRegistry> ModelRegistry::fromConfig(const Core::RedactorConfig &config,
							 const Logger::ILogger &logger)
{
	std::vector<BackendFactory> faceChain{
		[config]() -> std::unique_ptr<IDetectorBackend> {
			return std::make_unique<NcnnYoloBackend>("yolov8-face", config.faceModel, config.numThreads);
		},
		[config]() -> std::unique_ptr<IDetectorBackend> {
			return std::make_unique<CascadeBackend>("haar-face", config.faceCascade);
		},
	};

	std::vector<BackendFactory> plateChain{
		[config]() -> std::unique_ptr<IDetectorBackend> {
			return std::make_unique<NcnnYoloBackend>("yolov8-plate", config.plateModel, config.numThreads);
		},
		[config]() -> std::unique_ptr<IDetectorBackend> {
			return std::make_unique<CascadeBackend>("haar-plate", config.plateCascade);
		},
	};

	return std::make_unique<ModelRegistry>(logger, std::move(faceChain), std::move(plateChain));
}

ServedDetections ModelRegistry::detect(const cv::Mat &bgr, Core::Category category)
{
	ensureLoaded(category);

	Slot &slot = slotFor(category);
	const CapabilityState state = slot.state.load(std::memory_order_acquire);
	if (state != CapabilityState::LoadedPrimary && state != CapabilityState::LoadedFallback) {
		return {};
	}

	IDetectorBackend &backend = *slot.backend;
	return ServedDetections{backend.detect(bgr), backend.kind(), backend.name()};
}

bool ModelRegistry::isReady(Core::Category category) const noexcept
{
	const CapabilityState current = state(category);
	return current == CapabilityState::LoadedPrimary || current == CapabilityState::LoadedFallback;
}

CapabilityState ModelRegistry::state(Core::Category category) const noexcept
{
	return slotFor(category).state.load(std::memory_order_acquire);
}

bool ModelRegistry::modelsLoaded() const noexcept
{
	return isReady(Core::Category::Face) || isReady(Core::Category::LicensePlate);
}

void ModelRegistry::warmUp() noexcept
{
	ensureLoaded(Core::Category::Face);
	ensureLoaded(Core::Category::LicensePlate);
}

ModelRegistry::Slot &ModelRegistry::slotFor(Core::Category category) noexcept
{
	return slots_[static_cast<std::size_t>(category)];
}

const ModelRegistry::Slot &ModelRegistry::slotFor(Core::Category category) const noexcept
{
	return slots_[static_cast<std::size_t>(category)];
}

void ModelRegistry::ensureLoaded(Core::Category category) noexcept
{
	Slot &slot = slotFor(category);
	if (slot.state.load(std::memory_order_acquire) != CapabilityState::Unloaded) {
		return;
	}

	std::lock_guard<std::mutex> lock(slot.loadMutex);
	if (slot.state.load(std::memory_order_acquire) != CapabilityState::Unloaded) {
		return;
	}

	const std::string_view capability = Core::toString(category);

	for (std::size_t i = 0; i < slot.chain.size(); ++i) {
		const std::string position = std::to_string(i);
		try {
			std::unique_ptr<IDetectorBackend> backend = slot.chain[i]();
			if (!backend) {
				throw Core::BackendLoadError("NullBackend(ModelRegistry::ensureLoaded)");
			}
			backend->load();

			const CapabilityState loadedState =
				i == 0 ? CapabilityState::LoadedPrimary : CapabilityState::LoadedFallback;
			logger_.info("BackendLoaded", {{"capability", capability},
						       {"backend", backend->name()},
						       {"kind", toString(backend->kind())},
						       {"position", position},
						       {"state", toString(loadedState)}});

			slot.backend = std::move(backend);
			slot.state.store(loadedState, std::memory_order_release);
			return;
		} catch (const std::exception &e) {
			logger_.warn("BackendLoadError",
				     {{"capability", capability}, {"position", position}, {"reason", e.what()}});
		}
	}

	logger_.error("CapabilityUnavailable", {{"capability", capability}});
	slot.state.store(CapabilityState::Unavailable, std::memory_order_release);
}

} // namespace PrivacyGuard::Detection
