/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include "ImageTypes.hpp"
#include "ModelConfig.hpp"

namespace StreamStudio::HumanDetection {

/**
 * @brief A loaded segmentation model. Destroying it releases the model.
 */
class ISegmentationModel {
protected:
	ISegmentationModel() = default;

public:
	virtual ~ISegmentationModel() = default;

	/**
	 * @brief Classifies every pixel of the surface as human (1) or background (0).
	 *
	 * The returned buffer holds exactly surface.width * surface.height bytes.
	 * Throws on failure.
	 */
	virtual ClassificationBuffer segmentPerson(const BgraImageView &surface, const SegmentationOptions &options) = 0;

	ISegmentationModel(const ISegmentationModel &) = delete;
	ISegmentationModel &operator=(const ISegmentationModel &) = delete;
	ISegmentationModel(ISegmentationModel &&) = delete;
	ISegmentationModel &operator=(ISegmentationModel &&) = delete;
};

} // namespace StreamStudio::HumanDetection
