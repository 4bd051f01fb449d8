/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "SegmentationDecoder.hpp"

#include <cassert>

namespace StreamStudio::HumanDetection {

DecodedSegmentation decodeSegmentation(std::span<const std::uint8_t> classification, std::size_t width,
				       std::size_t height)
{
	const std::size_t pixelCount = width * height;
	assert(classification.size() == pixelCount);

	DecodedSegmentation decoded;
	decoded.mask.width = width;
	decoded.mask.height = height;
	decoded.mask.pixels.resize(pixelCount, MaskImage::kBackground);

	std::size_t foregroundCount = 0;
	for (std::size_t i = 0; i < pixelCount; i++) {
		if (classification[i] == 1) {
			decoded.mask.pixels[i] = MaskImage::kForeground;
			foregroundCount++;
		}
	}

	if (pixelCount > 0) {
		decoded.confidence = static_cast<double>(foregroundCount) / static_cast<double>(pixelCount);
	}

	return decoded;
}

} // namespace StreamStudio::HumanDetection
