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

#include <filesystem>
#include <set>
#include <string_view>

#include <PrivacyGuard/Core/Types.hpp>
#include <PrivacyGuard/Logger/ILogger.hpp>

namespace PrivacyGuard::Batch {

std::string_view fileExtension(Core::OutputFormat format) noexcept;

/**
 * Hands out `<outDir>/<stem>_redacted.<ext>` paths for one run.
 *
 * Two results sharing a stem (a.jpg and a.png, or the same name from two
 * directories) would land on the same file; the later one gets the result id
 * appended instead.
 */
class OutputPathPlanner {
public:
	OutputPathPlanner(std::filesystem::path outDir, const Logger::ILogger &logger);

	std::filesystem::path claim(const Core::ProcessedResult &result);

private:
	const std::filesystem::path outDir_;
	const Logger::ILogger &logger_;
	std::set<std::filesystem::path> claimed_;
};

} // namespace PrivacyGuard::Batch
