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

#include <cstdio>
#include <iterator>
#include <mutex>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "ILogger.hpp"

namespace StreamStudio::Logger {

/**
 * @brief Parses a textual log level ("debug", "info", "warn", "error").
 * @return std::nullopt for an unknown name.
 */
inline std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept
{
	if (name == "debug")
		return LogLevel::Debug;
	if (name == "info")
		return LogLevel::Info;
	if (name == "warn")
		return LogLevel::Warn;
	if (name == "error")
		return LogLevel::Error;
	return std::nullopt;
}

/**
 * @brief ILogger writing prefixed lines to a C stream (stderr by default).
 *
 * Messages below the minimum level are dropped. Writes are serialized so
 * lines from concurrent callers never interleave.
 */
class FmtLogger final : public ILogger {
public:
	explicit FmtLogger(std::string prefix, LogLevel minLevel = LogLevel::Info,
			   std::FILE *stream = stderr) noexcept
		: prefix_(std::move(prefix)),
		  minLevel_(minLevel),
		  stream_(stream)
	{
	}

	~FmtLogger() override = default;

protected:
	void log(LogLevel level, std::string_view message) const noexcept override
	{
		if (level < minLevel_)
			return;

		try {
			std::lock_guard<std::mutex> lock(mutex_);
			fmt::print(stream_, "{} [{}] {}\n", prefix_, getLevelName(level), message);
		} catch (...) {
			writePanic();
		}
	}

	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	{
		if (level < minLevel_)
			return;

		try {
			fmt::basic_memory_buffer<char, 4096> buffer;

			fmt::format_to(std::back_inserter(buffer), "{} [{}] name={}\tlocation={}:{}", prefix_,
				       getLevelName(level), name, loc.file_name(), loc.line());
			for (const LogField &field : context) {
				fmt::format_to(std::back_inserter(buffer), "\t{}={}", field.key, field.value);
			}

			std::lock_guard<std::mutex> lock(mutex_);
			fmt::print(stream_, "{}\n", std::string_view(buffer.data(), buffer.size()));
		} catch (...) {
			writePanic();
		}
	}

private:
	static std::string_view getLevelName(LogLevel level) noexcept
	{
		switch (level) {
		case LogLevel::Debug:
			return "debug";
		case LogLevel::Info:
			return "info";
		case LogLevel::Warn:
			return "warn";
		case LogLevel::Error:
			return "error";
		}
		return "unknown";
	}

	void writePanic() const noexcept
	{
		std::source_location errloc = std::source_location::current();
		std::fprintf(stream_, "%s name=LoggerPanic\tlocation=%s:%u\n", prefix_.c_str(), errloc.file_name(),
			     static_cast<unsigned>(errloc.line()));
	}

	const std::string prefix_;
	const LogLevel minLevel_;
	std::FILE *const stream_;
	mutable std::mutex mutex_;
};

} // namespace StreamStudio::Logger
