/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

#include "DetectionResult.hpp"

namespace StreamStudio::HumanDetection {

/**
 * @brief Rolling statistics over recent detection results.
 *
 * Read-only with respect to detection; consumers use it to decide whether to
 * lower quality or skip frames.
 */
class PerformanceMonitor {
public:
	using Milliseconds = std::chrono::duration<double, std::milli>;

	constexpr static std::size_t kDefaultWindowSize = 30;
	constexpr static Milliseconds kDefaultDegradedThreshold{50.0};

	explicit PerformanceMonitor(std::size_t windowSize = kDefaultWindowSize,
				    Milliseconds degradedThreshold = kDefaultDegradedThreshold);

	void record(const DetectionResult &result);
	void reset() noexcept;

	std::size_t getFrameCount() const noexcept;
	Milliseconds getAverageProcessingTime() const noexcept;
	double getAverageConfidence() const noexcept;

	// True when the windowed average processing time exceeds the threshold.
	bool isDegraded() const noexcept;

private:
	struct Sample {
		Milliseconds processingTime;
		double confidence;
	};

	const std::size_t windowSize_;
	const Milliseconds degradedThreshold_;

	mutable std::mutex mutex_;
	std::deque<Sample> samples_;
	std::size_t frameCount_ = 0;
};

} // namespace StreamStudio::HumanDetection
