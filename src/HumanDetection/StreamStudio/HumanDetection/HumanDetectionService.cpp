/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "HumanDetectionService.hpp"

#include <chrono>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include "BackendSelector.hpp"
#include "ModelConfig.hpp"
#include "SegmentationDecoder.hpp"

namespace StreamStudio::HumanDetection {

std::string_view toString(ServiceState state) noexcept
{
	switch (state) {
	case ServiceState::Uninitialized:
		return "Uninitialized";
	case ServiceState::Initializing:
		return "Initializing";
	case ServiceState::Ready:
		return "Ready";
	case ServiceState::Disposed:
		return "Disposed";
	}
	return "Unknown";
}

HumanDetectionService::HumanDetectionService(std::shared_ptr<const Logger::ILogger> logger,
					     std::shared_ptr<IComputeBackend> backend,
					     std::shared_ptr<IModelLoader> modelLoader)
	: logger_(logger ? std::move(logger) : throw std::invalid_argument("logger must not be null")),
	  backend_(backend ? std::move(backend) : throw std::invalid_argument("backend must not be null")),
	  modelLoader_(modelLoader ? std::move(modelLoader)
				   : throw std::invalid_argument("modelLoader must not be null"))
{
}

HumanDetectionService::~HumanDetectionService() noexcept
{
	dispose();
}

void HumanDetectionService::initialize()
{
	std::unique_lock<std::mutex> lock(stateMutex_);

	if (state_ == ServiceState::Ready) {
		return;
	}

	if (state_ == ServiceState::Initializing) {
		std::shared_future<void> inFlight = initialization_;
		lock.unlock();
		logger_->debug("InitializeJoined", {});
		inFlight.get();
		return;
	}

	std::promise<void> promise;
	initialization_ = promise.get_future().share();
	state_ = ServiceState::Initializing;
	lock.unlock();

	logger_->info("InitializeStarted", {});

	std::unique_ptr<ISegmentationModel> model;
	ComputeBackend activeBackend = ComputeBackend::Fallback;
	std::exception_ptr failure;
	try {
		model = loadModel(activeBackend);
	} catch (...) {
		failure = std::current_exception();
	}

	lock.lock();
	initialization_ = {};

	if (failure) {
		state_ = ServiceState::Uninitialized;
		lock.unlock();

		DetectionError error(DetectionErrorCode::ModelLoadFailed, "Failed to load the segmentation model",
				     failure);
		logger_->error("InitializeFailed", {{"code", toString(error.code())}, {"cause", error.causeMessage()}});

		std::exception_ptr errorPtr = std::make_exception_ptr(std::move(error));
		promise.set_exception(errorPtr);
		std::rethrow_exception(errorPtr);
	}

	model_ = std::move(model);
	state_ = ServiceState::Ready;
	lock.unlock();

	promise.set_value();
	logger_->info("InitializeSucceeded", {{"backend", toString(activeBackend)}});
}

std::unique_ptr<ISegmentationModel> HumanDetectionService::loadModel(ComputeBackend &activeBackend)
{
	backend_->ready();
	activeBackend = selectBackend(*backend_, *logger_);

	std::unique_ptr<ISegmentationModel> model = modelLoader_->load(kModelConfig);
	if (!model) {
		throw std::runtime_error("model loader returned no model");
	}
	return model;
}

void HumanDetectionService::dispose() noexcept
{
	std::lock_guard<std::mutex> detectionLock(detectionMutex_);
	std::unique_lock<std::mutex> lock(stateMutex_);

	while (state_ == ServiceState::Initializing) {
		std::shared_future<void> inFlight = initialization_;
		lock.unlock();
		inFlight.wait();
		lock.lock();
	}

	const bool hadModel = model_ != nullptr;
	const ServiceState previousState = state_;

	model_.reset();
	if (hadModel) {
		backend_->releaseResources();
	}
	scratchSurface_.release();
	state_ = ServiceState::Disposed;
	lock.unlock();

	if (previousState != ServiceState::Disposed) {
		logger_->info("Disposed", {{"previousState", toString(previousState)}});
	}
}

DetectionResult HumanDetectionService::detectHumans(const BgraImageView &image)
{
	std::lock_guard<std::mutex> detectionLock(detectionMutex_);

	ISegmentationModel *model;
	{
		std::lock_guard<std::mutex> lock(stateMutex_);
		if (state_ != ServiceState::Ready) {
			throw DetectionError(DetectionErrorCode::NotInitialized,
					     "Human detection service is not initialized (state: " +
						     std::string(toString(state_)) + ")");
		}
		// dispose() needs detectionMutex_, so the model outlives this call.
		model = model_.get();
	}

	ClassificationBuffer classification;
	std::chrono::duration<double, std::milli> processingTime{0.0};
	try {
		if (!image.isWellFormed()) {
			throw std::invalid_argument("image must have non-null data, non-zero size and stride >= width * 4");
		}

		ScratchSurface::Lease lease = scratchSurface_.acquire(image.width, image.height);
		lease.write(image);

		const auto start = std::chrono::steady_clock::now();
		classification = model->segmentPerson(lease.view(), kSegmentationOptions);
		processingTime = std::chrono::steady_clock::now() - start;
	} catch (...) {
		DetectionError error(DetectionErrorCode::DetectionFailed, "Failed to detect humans in image",
				     std::current_exception());
		logger_->warn("DetectionFailed", {{"cause", error.causeMessage()}});
		throw error;
	}

	DecodedSegmentation decoded =
		decodeSegmentation(std::span<const std::uint8_t>(classification), image.width, image.height);

	DetectionResult result;
	result.mask = std::move(decoded.mask);
	result.confidence = decoded.confidence;
	result.processingTime = processingTime;
	return result;
}

ServiceState HumanDetectionService::getState() const noexcept
{
	std::lock_guard<std::mutex> lock(stateMutex_);
	return state_;
}

} // namespace StreamStudio::HumanDetection
