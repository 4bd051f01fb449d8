/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <string_view>

namespace StreamStudio::HumanDetection {

enum class ComputeBackend { Accelerated, Fallback };

inline std::string_view toString(ComputeBackend backend) noexcept
{
	return backend == ComputeBackend::Accelerated ? "accelerated" : "fallback";
}

/**
 * @brief Query/switch access to the inference runtime's execution target.
 *
 * ready() and setBackend() throw on failure.
 */
class IComputeBackend {
protected:
	IComputeBackend() = default;

public:
	virtual ~IComputeBackend() = default;

	virtual void ready() = 0;
	virtual ComputeBackend getBackend() const = 0;
	virtual void setBackend(ComputeBackend backend) = 0;

	// Frees allocations the runtime retains after every model is gone.
	virtual void releaseResources() noexcept = 0;

	IComputeBackend(const IComputeBackend &) = delete;
	IComputeBackend &operator=(const IComputeBackend &) = delete;
	IComputeBackend(IComputeBackend &&) = delete;
	IComputeBackend &operator=(IComputeBackend &&) = delete;
};

} // namespace StreamStudio::HumanDetection
