/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace StreamStudio::HumanDetection {

enum class DetectionErrorCode {
	NotInitialized,
	ModelLoadFailed,
	DetectionFailed,
};

std::string_view toString(DetectionErrorCode code) noexcept;

/**
 * @brief The only exception type thrown across the HumanDetectionService boundary.
 *
 * Callers are expected to treat ModelLoadFailed as "feature unavailable",
 * DetectionFailed as "skip this frame" and NotInitialized as a sequencing bug.
 *
 * The cause is also exposed through std::nested_exception, so
 * ILogger::logException and std::rethrow_if_nested see it.
 */
class DetectionError : public std::runtime_error, public std::nested_exception {
public:
	DetectionError(DetectionErrorCode code, const std::string &message, std::exception_ptr cause = nullptr);

	DetectionErrorCode code() const noexcept { return code_; }

	/**
	 * @brief The underlying failure that triggered this error, or nullptr.
	 */
	const std::exception_ptr &cause() const noexcept { return cause_; }

	/**
	 * @brief what() of the wrapped cause; "unknown" for a non-std::exception
	 * cause and an empty string when there is none.
	 */
	std::string causeMessage() const;

private:
	DetectionErrorCode code_;
	std::exception_ptr cause_;
};

} // namespace StreamStudio::HumanDetection
