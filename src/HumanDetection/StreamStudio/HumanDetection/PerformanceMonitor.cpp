/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PerformanceMonitor.hpp"

#include <numeric>
#include <stdexcept>

namespace StreamStudio::HumanDetection {

PerformanceMonitor::PerformanceMonitor(std::size_t windowSize, Milliseconds degradedThreshold)
	: windowSize_(windowSize > 0 ? windowSize : throw std::invalid_argument("windowSize must be greater than 0")),
	  degradedThreshold_(degradedThreshold)
{
}

void PerformanceMonitor::record(const DetectionResult &result)
{
	std::lock_guard<std::mutex> lock(mutex_);

	if (samples_.size() == windowSize_) {
		samples_.pop_front();
	}

	samples_.push_back({result.processingTime, result.confidence});
	frameCount_++;
}

void PerformanceMonitor::reset() noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	samples_.clear();
	frameCount_ = 0;
}

std::size_t PerformanceMonitor::getFrameCount() const noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	return frameCount_;
}

PerformanceMonitor::Milliseconds PerformanceMonitor::getAverageProcessingTime() const noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (samples_.empty())
		return Milliseconds{0.0};
	// Summed on read so evicted samples leave no rounding residue.
	const Milliseconds sum = std::accumulate(samples_.begin(), samples_.end(), Milliseconds{0.0},
						 [](Milliseconds acc, const Sample &s) { return acc + s.processingTime; });
	return sum / static_cast<double>(samples_.size());
}

double PerformanceMonitor::getAverageConfidence() const noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (samples_.empty())
		return 0.0;
	const double sum = std::accumulate(samples_.begin(), samples_.end(), 0.0,
					   [](double acc, const Sample &s) { return acc + s.confidence; });
	return sum / static_cast<double>(samples_.size());
}

bool PerformanceMonitor::isDegraded() const noexcept
{
	return getAverageProcessingTime() > degradedThreshold_;
}

} // namespace StreamStudio::HumanDetection
