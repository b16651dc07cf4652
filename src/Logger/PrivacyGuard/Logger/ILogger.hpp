/*
 * Privacy Guard Logger Library
 * Copyright (C) 2025 Privacy Guard contributors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <exception>
#include <initializer_list>
#include <iterator>
#include <source_location>
#include <span>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace PrivacyGuard::Logger {

struct LogField {
	std::string_view key;
	std::string_view value;
};

/**
 * @class ILogger
 * @brief A thread-safe, noexcept interface for polymorphic logging.
 *
 * All public logging methods (debug, info, warn, error) are guaranteed not
 * to throw. If formatting fails internally, the logger writes a fixed panic
 * line instead of the message.
 *
 * The structured overloads take an event name and a list of key/value
 * fields. The detection pipeline uses them to report which stage, filter
 * and threshold rejected or recovered something, so that logs can be
 * grepped when tuning thresholds offline.
 */
class ILogger {
public:
	/**
	 * @brief Default constructor.
	 */
	ILogger() noexcept = default;

	/**
	 * @brief Virtual destructor so concrete loggers are destroyed through the interface.
	 */
	virtual ~ILogger() = default;

	/** @name Non-Copyable and Non-Movable
	 * @{
	 */
	ILogger(const ILogger &) = delete;
	ILogger &operator=(const ILogger &) = delete;
	ILogger(ILogger &&) = delete;
	ILogger &operator=(ILogger &&) = delete;
	/** @} */

	/** @name Formatted messages
	 * Free-form lines built with fmt. A format failure becomes the panic line.
	 * @{
	 */

	template<typename... Args> void debug(fmt::format_string<Args...> fmt, Args &&...args) const noexcept
	{
		formatAndLog(LogLevel::Debug, fmt, std::forward<Args>(args)...);
	}

	template<typename... Args> void info(fmt::format_string<Args...> fmt, Args &&...args) const noexcept
	{
		formatAndLog(LogLevel::Info, fmt, std::forward<Args>(args)...);
	}

	template<typename... Args> void warn(fmt::format_string<Args...> fmt, Args &&...args) const noexcept
	{
		formatAndLog(LogLevel::Warn, fmt, std::forward<Args>(args)...);
	}

	template<typename... Args> void error(fmt::format_string<Args...> fmt, Args &&...args) const noexcept
	{
		formatAndLog(LogLevel::Error, fmt, std::forward<Args>(args)...);
	}

	/** @} */

	/** @name Structured events
	 * An event name such as `PlateRejected` plus key/value fields. Values are
	 * only borrowed for the duration of the call.
	 * @{
	 */
	void debug(std::string_view name, std::initializer_list<LogField> context,
		   std::source_location loc = std::source_location::current()) const noexcept
	{
		log(LogLevel::Debug, name, loc, context);
	}

	void info(std::string_view name, std::initializer_list<LogField> context,
		  std::source_location loc = std::source_location::current()) const noexcept
	{
		log(LogLevel::Info, name, loc, context);
	}

	void warn(std::string_view name, std::initializer_list<LogField> context,
		  std::source_location loc = std::source_location::current()) const noexcept
	{
		log(LogLevel::Warn, name, loc, context);
	}

	void error(std::string_view name, std::initializer_list<LogField> context,
		   std::source_location loc = std::source_location::current()) const noexcept
	{
		log(LogLevel::Error, name, loc, context);
	}
	/** @} */

	/**
	 * @brief Logs an exception with context.
	 *
	 * Safe to call from within a catch block.
	 *
	 * @param e The exception that was caught.
	 * @param context Where the exception was caught.
	 */
	void logException(const std::exception &e, std::string_view context) const noexcept
	{
		error("{}: {}", context, e.what());
	}

protected:
	enum class LogLevel { Debug, Info, Warn, Error };

	/**
	 * @brief Writes one already formatted line. Must not throw.
	 */
	virtual void log(LogLevel level, std::string_view message) const noexcept = 0;

	/**
	 * @brief Writes one structured event. `loc` is the call site of the public overload.
	 */
	virtual void log(LogLevel level, std::string_view name, std::source_location loc,
			 std::span<const LogField> context) const noexcept = 0;

private:
	template<typename... Args>
	void formatAndLog(LogLevel level, fmt::format_string<Args...> fmt, Args &&...args) const noexcept
	try {
		fmt::basic_memory_buffer<char, 4096> buffer;
		fmt::vformat_to(std::back_inserter(buffer), fmt, fmt::make_format_args(args...));
		log(level, {buffer.data(), buffer.size()});
	} catch (...) {
		log(LogLevel::Error, "LOGGER PANIC OCCURRED");
	}
};

} // namespace PrivacyGuard::Logger
