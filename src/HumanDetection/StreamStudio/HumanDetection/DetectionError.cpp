/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "DetectionError.hpp"

#include <utility>

namespace StreamStudio::HumanDetection {

namespace {

// std::nested_exception captures the exception being handled, so the cause is
// rethrown to make it current while the nested_exception is constructed.
std::nested_exception nestCause(const std::exception_ptr &cause)
{
	if (cause) {
		try {
			std::rethrow_exception(cause);
		} catch (...) {
			return std::nested_exception();
		}
	}
	return std::nested_exception();
}

} // anonymous namespace

std::string_view toString(DetectionErrorCode code) noexcept
{
	switch (code) {
	case DetectionErrorCode::NotInitialized:
		return "NotInitialized";
	case DetectionErrorCode::ModelLoadFailed:
		return "ModelLoadFailed";
	case DetectionErrorCode::DetectionFailed:
		return "DetectionFailed";
	}
	return "Unknown";
}

DetectionError::DetectionError(DetectionErrorCode code, const std::string &message, std::exception_ptr cause)
	: std::runtime_error(message),
	  std::nested_exception(nestCause(cause)),
	  code_(code),
	  cause_(std::move(cause))
{
}

std::string DetectionError::causeMessage() const
{
	if (!cause_)
		return {};

	try {
		std::rethrow_exception(cause_);
	} catch (const std::exception &e) {
		return e.what();
	} catch (...) {
		return "unknown";
	}
}

} // namespace StreamStudio::HumanDetection
