/*
 * Privacy Guard Logger Library
 * Copyright (C) 2025 Privacy Guard contributors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdio>
#include <iterator>
#include <mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "ILogger.hpp"

namespace PrivacyGuard::Logger {

class ConsoleLogger final : public ILogger {
public:
	ConsoleLogger(std::string prefix, bool verbose) noexcept : prefix_(std::move(prefix)), verbose_(verbose) {}

	~ConsoleLogger() override = default;

protected:
	void log(LogLevel level, std::string_view message) const noexcept override
	{
		if (level == LogLevel::Debug && !verbose_) {
			return;
		}

		std::lock_guard<std::mutex> lock(mutex_);
		std::fprintf(stderr, "%s %s %.*s\n", prefix_.c_str(), getLevelName(level),
			     static_cast<int>(message.length()), message.data());
	}

	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	{
		if (level == LogLevel::Debug && !verbose_) {
			return;
		}

		try {
			fmt::basic_memory_buffer<char, 4096> buffer;

			fmt::format_to(std::back_inserter(buffer), "{} {} name={}\tlocation={}:{}", prefix_,
				       getLevelName(level), name, loc.file_name(), loc.line());
			for (const LogField &field : context) {
				fmt::format_to(std::back_inserter(buffer), "\t{}={}", field.key, field.value);
			}

			std::lock_guard<std::mutex> lock(mutex_);
			std::fprintf(stderr, "%.*s\n", static_cast<int>(buffer.size()), buffer.data());
		} catch (...) {
			std::source_location errloc = std::source_location::current();
			std::fprintf(stderr, "%s %s name=LoggerPanic\tlocation=%s:%u\n", prefix_.c_str(),
				     getLevelName(level), errloc.file_name(), static_cast<unsigned>(errloc.line()));
		}
	}

private:
	const std::string prefix_;
	const bool verbose_;
	mutable std::mutex mutex_;

	static const char *getLevelName(LogLevel level) noexcept
	{
		switch (level) {
		case LogLevel::Debug:
			return "[debug]";
		case LogLevel::Info:
			return "[info]";
		case LogLevel::Warn:
			return "[warning]";
		case LogLevel::Error:
			return "[error]";
		default:
			return "[unknown]";
		}
	}
};

} // namespace PrivacyGuard::Logger
