/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "BackendSelector.hpp"

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace StreamStudio::HumanDetection {

namespace {

constexpr ComputeBackend kPreferredBackend = ComputeBackend::Accelerated;
constexpr ComputeBackend kFallbackBackend = ComputeBackend::Fallback;

// Must be called from within a catch handler.
std::string describeCurrentException()
try {
	std::rethrow_exception(std::current_exception());
} catch (const std::exception &e) {
	return e.what();
} catch (...) {
	return "unknown";
}

std::optional<ComputeBackend> queryBackend(IComputeBackend &backend, const Logger::ILogger &logger) noexcept
{
	try {
		const ComputeBackend current = backend.getBackend();
		logger.debug("BackendQueried", {{"backend", toString(current)}});
		return current;
	} catch (...) {
		const std::string message = describeCurrentException();
		logger.warn("BackendQueryFailed", {{"message", message}});
		return std::nullopt;
	}
}

bool switchBackend(IComputeBackend &backend, ComputeBackend target, std::string_view failureEvent,
		   const Logger::ILogger &logger) noexcept
{
	try {
		backend.setBackend(target);
		return true;
	} catch (...) {
		const std::string message = describeCurrentException();
		logger.warn(failureEvent, {{"backend", toString(target)}, {"message", message}});
		return false;
	}
}

} // anonymous namespace

ComputeBackend selectBackend(IComputeBackend &backend, const Logger::ILogger &logger) noexcept
{
	const std::optional<ComputeBackend> current = queryBackend(backend, logger);
	if (current == kPreferredBackend)
		return *current;

	if (switchBackend(backend, kPreferredBackend, "BackendSwitchFailed", logger))
		return queryBackend(backend, logger).value_or(kPreferredBackend);

	const bool fellBack = switchBackend(backend, kFallbackBackend, "BackendFallbackFailed", logger);
	return queryBackend(backend, logger).value_or(fellBack ? kFallbackBackend : current.value_or(kFallbackBackend));
}

} // namespace StreamStudio::HumanDetection
