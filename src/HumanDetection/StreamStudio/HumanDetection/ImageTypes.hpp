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
#include <vector>

namespace StreamStudio::HumanDetection {

/**
 * @brief Non-owning view of a four-channel, 8-bit-per-channel image.
 *
 * A stride of 0 means tightly packed rows (width * 4 bytes).
 */
struct BgraImageView {
	const std::uint8_t *data = nullptr;
	std::size_t width = 0;
	std::size_t height = 0;
	std::size_t stride = 0;

	std::size_t getStride() const noexcept { return stride != 0 ? stride : width * 4; }
	std::size_t getPixelCount() const noexcept { return width * height; }

	bool isWellFormed() const noexcept
	{
		return data != nullptr && width > 0 && height > 0 && getStride() >= width * 4;
	}
};

/**
 * @brief Single-channel 8-bit mask, row-major, one byte per pixel.
 *
 * Background pixels are kBackground and human pixels are kForeground. The
 * compositor reads it as an alpha plane.
 */
struct MaskImage {
	constexpr static std::uint8_t kBackground = 0;
	constexpr static std::uint8_t kForeground = 255;

	std::size_t width = 0;
	std::size_t height = 0;
	std::vector<std::uint8_t> pixels;
};

/**
 * @brief One byte per source pixel, 1 for human and 0 for background.
 */
using ClassificationBuffer = std::vector<std::uint8_t>;

} // namespace StreamStudio::HumanDetection
