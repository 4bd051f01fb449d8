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
#include <string_view>

namespace StreamStudio::HumanDetection {

enum class ModelArchitecture { SelfieSegmentationLandscape };

enum class ModelPrecision { Float32, Float16, Int8 };

enum class InternalResolution { Low, Medium, High, Full };

struct ModelConfig {
	ModelArchitecture architecture;
	std::size_t inputWidth;
	std::size_t inputHeight;
	ModelPrecision precision;
};

struct SegmentationOptions {
	bool flipHorizontal;
	InternalResolution internalResolution;
	float segmentationThreshold;
	int maxDetections;
	float scoreThreshold;
	int nmsRadius;
};

// Service-level policy. These are not per-call or per-caller parameters.
inline constexpr ModelConfig kModelConfig{ModelArchitecture::SelfieSegmentationLandscape, 256, 144,
					  ModelPrecision::Int8};

inline constexpr SegmentationOptions kSegmentationOptions{false, InternalResolution::Medium, 0.7f, 10, 0.3f, 20};

inline std::string_view toString(ModelPrecision precision) noexcept
{
	switch (precision) {
	case ModelPrecision::Float32:
		return "float32";
	case ModelPrecision::Float16:
		return "float16";
	case ModelPrecision::Int8:
		return "int8";
	}
	return "unknown";
}

} // namespace StreamStudio::HumanDetection
