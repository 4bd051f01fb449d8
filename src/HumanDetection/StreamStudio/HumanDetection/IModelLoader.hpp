/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>

#include "ISegmentationModel.hpp"
#include "ModelConfig.hpp"

namespace StreamStudio::HumanDetection {

class IModelLoader {
protected:
	IModelLoader() = default;

public:
	virtual ~IModelLoader() = default;

	// Throws on failure; never returns nullptr.
	virtual std::unique_ptr<ISegmentationModel> load(const ModelConfig &config) = 0;

	IModelLoader(const IModelLoader &) = delete;
	IModelLoader &operator=(const IModelLoader &) = delete;
	IModelLoader(IModelLoader &&) = delete;
	IModelLoader &operator=(IModelLoader &&) = delete;
};

} // namespace StreamStudio::HumanDetection
