/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <StreamStudio/Logger/ILogger.hpp>

#include "IComputeBackend.hpp"

namespace StreamStudio::HumanDetection {

/**
 * @brief Best-effort switch to the accelerated backend before a model load.
 *
 * If the runtime is not already accelerated, a switch to Accelerated is
 * requested; if that fails, a switch to Fallback is requested so the runtime
 * ends up in a known state. No failure propagates, whatever is thrown and
 * whether it comes from a switch or a backend query: the model load that
 * follows decides whether initialization succeeds.
 *
 * @return The backend reported by the runtime after selection. When that
 * query fails, the backend last switched to successfully.
 */
ComputeBackend selectBackend(IComputeBackend &backend, const Logger::ILogger &logger) noexcept;

} // namespace StreamStudio::HumanDetection
