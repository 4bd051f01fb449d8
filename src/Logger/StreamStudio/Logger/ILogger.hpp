/*
 * StreamStudio Logger Library
 * Copyright (C) 2026 The StreamStudio Authors
 * Portions Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
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
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace StreamStudio::Logger {

struct LogField {
	std::string_view key;
	std::string_view value;
};

enum class LogLevel { Debug, Info, Warn, Error };

/**
 * @class ILogger
 * @brief A thread-safe, noexcept interface for polymorphic logging.
 *
 * All public logging methods are guaranteed not to throw. If formatting
 * fails (e.g. std::bad_alloc), a fixed panic line is logged instead.
 *
 * Two call styles are supported: fmt-style messages and structured events
 * made of a stable event name plus key/value fields.
 */
class ILogger {
public:
	ILogger() noexcept = default;

	virtual ~ILogger() = default;

	ILogger(const ILogger &) = delete;
	ILogger &operator=(const ILogger &) = delete;
	ILogger(ILogger &&) = delete;
	ILogger &operator=(ILogger &&) = delete;

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

	/**
	 * @brief Logs an exception and every exception nested inside it.
	 *
	 * Safe to call from within a catch block. Causes attached through
	 * std::nested_exception are emitted as additional `cause` events.
	 *
	 * @param e The exception that was caught.
	 * @param name The event name describing where the exception occurred.
	 */
	void logException(const std::exception &e, std::string_view name,
			   std::source_location loc = std::source_location::current()) const noexcept
	{
		log(LogLevel::Error, name, loc, std::initializer_list<LogField>{{"message", e.what()}});
		logNested(e, name, loc);
	}

protected:
	virtual void log(LogLevel level, std::string_view message) const noexcept = 0;
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

	void logNested(const std::exception &e, std::string_view name, std::source_location loc) const noexcept
	{
		const auto *nested = dynamic_cast<const std::nested_exception *>(&e);
		if (!nested || !nested->nested_ptr())
			return;

		try {
			nested->rethrow_nested();
		} catch (const std::exception &cause) {
			log(LogLevel::Error, name, loc, std::initializer_list<LogField>{{"cause", cause.what()}});
			logNested(cause, name, loc);
		} catch (...) {
			log(LogLevel::Error, name, loc, std::initializer_list<LogField>{{"cause", "unknown"}});
		}
	}
};

} // namespace StreamStudio::Logger
