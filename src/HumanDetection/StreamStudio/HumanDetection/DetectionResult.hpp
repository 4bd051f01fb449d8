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

#include "ImageTypes.hpp"

namespace StreamStudio::HumanDetection {

struct DetectionResult {
	MaskImage mask;
	// Fraction of foreground pixels, in [0, 1].
	double confidence = 0.0;
	// Wall-clock time spent inside the segmentation call only.
	std::chrono::duration<double, std::milli> processingTime{0.0};
};

} // namespace StreamStudio::HumanDetection
