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
#include <mutex>
#include <string>

#ifdef STREAMSTUDIO_PREFIXED_NCNN_HEADERS
#include <ncnn/net.h>
#else
#include <net.h>
#endif

#include <StreamStudio/Logger/ILogger.hpp>

#include "IComputeBackend.hpp"
#include "IModelLoader.hpp"
#include "ISegmentationModel.hpp"
#include "ModelConfig.hpp"

namespace StreamStudio::HumanDetection {

/**
 * @brief A share of ncnn's process-wide GPU instance.
 *
 * The instance is created when the first share is taken and destroyed when
 * the last one is dropped, so backends and models in several services can
 * use Vulkan at the same time. Null when no share is held.
 */
using NcnnGpuInstanceShare = std::shared_ptr<void>;

/**
 * @brief ncnn execution target: Vulkan compute when accelerated, CPU otherwise.
 *
 * Switching to Accelerated takes a share of the ncnn GPU instance and fails
 * when ncnn was built without Vulkan or no device is present.
 * releaseResources() drops the share.
 */
class NcnnComputeBackend final : public IComputeBackend {
public:
	explicit NcnnComputeBackend(std::shared_ptr<const Logger::ILogger> logger);
	~NcnnComputeBackend() noexcept override;

	void ready() override;
	ComputeBackend getBackend() const override;
	void setBackend(ComputeBackend backend) override;
	void releaseResources() noexcept override;

	NcnnGpuInstanceShare getGpuInstance() const;

	/**
	 * @brief Number of GPU instance shares taken by backends in this process
	 * and not yet fully dropped.
	 */
	static int getGpuInstanceShareCount() noexcept;

private:
	const std::shared_ptr<const Logger::ILogger> logger_;

	mutable std::mutex mutex_;
	ComputeBackend backend_ = ComputeBackend::Fallback;
	NcnnGpuInstanceShare gpuInstance_;
};

class NcnnSegmentationModel final : public ISegmentationModel {
public:
	/**
	 * @param gpuInstance Held for the model's lifetime; Vulkan compute is used
	 * when it is non-null.
	 */
	NcnnSegmentationModel(const std::string &paramPath, const std::string &binPath, const ModelConfig &config,
			      NcnnGpuInstanceShare gpuInstance, int numThreads);
	~NcnnSegmentationModel() noexcept override = default;

	ClassificationBuffer segmentPerson(const BgraImageView &surface, const SegmentationOptions &options) override;

private:
	const ModelConfig config_;
	// Declared before net_ so the instance outlives the network.
	const NcnnGpuInstanceShare gpuInstance_;
	ncnn::Net net_;
	ncnn::Mat outputMat_;
};

/**
 * @brief Loads NcnnSegmentationModel from .param/.bin files on the backend
 * currently selected in NcnnComputeBackend.
 */
class NcnnModelLoader final : public IModelLoader {
public:
	NcnnModelLoader(std::shared_ptr<const Logger::ILogger> logger, std::shared_ptr<const NcnnComputeBackend> backend,
			std::string paramPath, std::string binPath, int numThreads);

	std::unique_ptr<ISegmentationModel> load(const ModelConfig &config) override;

private:
	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::shared_ptr<const NcnnComputeBackend> backend_;
	const std::string paramPath_;
	const std::string binPath_;
	const int numThreads_;
};

} // namespace StreamStudio::HumanDetection
