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

#include "PrivacyGuard/Batch/OutputPathPlanner.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>

namespace PrivacyGuard::Batch {

std::string_view fileExtension(Core::OutputFormat format) noexcept
{
	return format == Core::OutputFormat::Jpeg ? "jpg" : Core::toString(format);
}

OutputPathPlanner::OutputPathPlanner(std::filesystem::path outDir, const Logger::ILogger &logger)
	: outDir_(std::move(outDir)),
	  logger_(logger)
{
}

std::filesystem::path OutputPathPlanner::claim(const Core::ProcessedResult &result)
{
	const std::string stem = std::filesystem::path(result.originalFilename).stem().string();
	const std::string_view extension = fileExtension(result.format);

	std::filesystem::path path = outDir_ / fmt::format("{}_redacted.{}", stem, extension);
	if (claimed_.insert(path).second) {
		return path;
	}

	const std::filesystem::path taken = path;
	path = outDir_ / fmt::format("{}_redacted_{}.{}", stem, result.id, extension);
	for (int suffix = 2; !claimed_.insert(path).second; ++suffix) {
		path = outDir_ / fmt::format("{}_redacted_{}_{}.{}", stem, result.id, suffix, extension);
	}

	logger_.info("OutputRenamed", {{"filename", result.originalFilename},
				       {"taken", taken.string()},
				       {"path", path.string()}});
	return path;
}

} // namespace PrivacyGuard::Batch
