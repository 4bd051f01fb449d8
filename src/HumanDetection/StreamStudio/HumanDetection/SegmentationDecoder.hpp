/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "ImageTypes.hpp"

namespace StreamStudio::HumanDetection {

struct DecodedSegmentation {
	MaskImage mask;
	double confidence = 0.0;
};

/**
 * @brief Turns a per-pixel classification buffer into a mask and a confidence.
 *
 * mask.pixels[i] is MaskImage::kForeground where classification[i] == 1 and
 * MaskImage::kBackground otherwise. confidence is the foreground pixel count
 * divided by width * height.
 *
 * classification.size() must equal width * height; this is a contract of the
 * segmentation model and is only checked by assert.
 */
DecodedSegmentation decodeSegmentation(std::span<const std::uint8_t> classification, std::size_t width,
				       std::size_t height);

} // namespace StreamStudio::HumanDetection
