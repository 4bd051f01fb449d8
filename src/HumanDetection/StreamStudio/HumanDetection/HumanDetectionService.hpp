/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <string_view>

#include <StreamStudio/Logger/ILogger.hpp>

#include "DetectionError.hpp"
#include "DetectionResult.hpp"
#include "IComputeBackend.hpp"
#include "IModelLoader.hpp"
#include "ISegmentationModel.hpp"
#include "ImageTypes.hpp"
#include "ScratchSurface.hpp"

namespace StreamStudio::HumanDetection {

enum class ServiceState { Uninitialized, Initializing, Ready, Disposed };

std::string_view toString(ServiceState state) noexcept;

/**
 * @class HumanDetectionService
 * @brief Owns one segmentation model and runs per-frame human detection on it.
 *
 * Lifecycle: Uninitialized -> Initializing -> Ready -> Disposed, with
 * Disposed -> Initializing allowed. A failed load goes back to Uninitialized.
 *
 * initialize() is single-flight: concurrent callers join the attempt already
 * in progress and observe its outcome, so the model is loaded at most once per
 * attempt. detectHumans() calls are serialized on one instance because they
 * share the model and the scratch surface; run several instances for parallel
 * throughput.
 *
 * No worker threads are created. All work runs on the calling threads and no
 * timeout is applied; a slow load or segmentation blocks its caller.
 *
 * Every failure surfaces as DetectionError.
 */
class HumanDetectionService {
public:
	HumanDetectionService(std::shared_ptr<const Logger::ILogger> logger, std::shared_ptr<IComputeBackend> backend,
			      std::shared_ptr<IModelLoader> modelLoader);

	~HumanDetectionService() noexcept;

	HumanDetectionService(const HumanDetectionService &) = delete;
	HumanDetectionService &operator=(const HumanDetectionService &) = delete;
	HumanDetectionService(HumanDetectionService &&) = delete;
	HumanDetectionService &operator=(HumanDetectionService &&) = delete;

	/**
	 * @brief Loads the model unless it is already loaded.
	 *
	 * Returns immediately when Ready and joins the in-flight attempt when
	 * Initializing. Otherwise selects the compute backend and loads the model
	 * with kModelConfig.
	 *
	 * @throw DetectionError with ModelLoadFailed when the readiness check or
	 * the load fails. The service is left Uninitialized and may be retried.
	 */
	void initialize();

	/**
	 * @brief Releases the model, backend resources and the scratch surface.
	 *
	 * Safe in every state. Waits for an in-flight initialize() to settle and
	 * for a running detectHumans() to return before tearing down.
	 */
	void dispose() noexcept;

	/**
	 * @brief Segments the humans in one frame.
	 *
	 * @param image A well-formed four-channel image; it is copied, not retained.
	 * @return A mask with exactly the image's width and height.
	 *
	 * @throw DetectionError NotInitialized unless Ready (no load is attempted).
	 * @throw DetectionError DetectionFailed when segmentation fails or the
	 * image is malformed. The service stays Ready.
	 */
	DetectionResult detectHumans(const BgraImageView &image);

	ServiceState getState() const noexcept;

private:
	std::unique_ptr<ISegmentationModel> loadModel(ComputeBackend &activeBackend);

	const std::shared_ptr<const Logger::ILogger> logger_;
	const std::shared_ptr<IComputeBackend> backend_;
	const std::shared_ptr<IModelLoader> modelLoader_;

	// Guards state_, model_ and initialization_.
	mutable std::mutex stateMutex_;
	ServiceState state_ = ServiceState::Uninitialized;
	std::unique_ptr<ISegmentationModel> model_;
	std::shared_future<void> initialization_;

	// Held for a whole detection, and by dispose(). Always taken before stateMutex_.
	std::mutex detectionMutex_;
	ScratchSurface scratchSurface_;
};

} // namespace StreamStudio::HumanDetection
