/*
 * StreamStudio Tests
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <StreamStudio/HumanDetection/HumanDetectionService.hpp>
#include <StreamStudio/HumanDetection/ModelConfig.hpp>

#include "../NullLogger.hpp"
#include "../RecordingLogger.hpp"
#include "FakeSegmentationRuntime.hpp"

using namespace StreamStudio::HumanDetection;
using namespace StreamStudio::HumanDetection::Testing;

namespace {

class HumanDetectionServiceTest : public ::testing::Test {
protected:
	std::shared_ptr<RecordingLogger> logger = std::make_shared<RecordingLogger>();
	std::shared_ptr<FakeComputeBackend> backend = std::make_shared<FakeComputeBackend>();
	std::shared_ptr<FakeModelLoader> loader = std::make_shared<FakeModelLoader>();
	std::unique_ptr<HumanDetectionService> service =
		std::make_unique<HumanDetectionService>(logger, backend, loader);
	std::vector<std::uint8_t> storage;
};

DetectionErrorCode codeOf(const std::exception_ptr &error)
{
	try {
		std::rethrow_exception(error);
	} catch (const DetectionError &e) {
		return e.code();
	} catch (const std::exception &e) {
		ADD_FAILURE() << "expected DetectionError, got: " << e.what();
	}
	return DetectionErrorCode::NotInitialized;
}

} // anonymous namespace

TEST_F(HumanDetectionServiceTest, StartsUninitialized)
{
	EXPECT_EQ(service->getState(), ServiceState::Uninitialized);
}

TEST_F(HumanDetectionServiceTest, DetectBeforeInitializeFailsWithNotInitialized)
{
	BgraImageView image = makeImage(storage, 2, 2);

	try {
		service->detectHumans(image);
		FAIL() << "detectHumans must fail before initialize";
	} catch (const DetectionError &e) {
		EXPECT_EQ(e.code(), DetectionErrorCode::NotInitialized);
	}

	EXPECT_EQ(loader->loadCount.load(), 0);
	EXPECT_EQ(service->getState(), ServiceState::Uninitialized);
}

TEST_F(HumanDetectionServiceTest, DisposeBeforeInitializeIsHarmless)
{
	EXPECT_NO_THROW(service->dispose());
	EXPECT_NO_THROW(service->dispose());

	EXPECT_EQ(service->getState(), ServiceState::Disposed);
	EXPECT_EQ(backend->releaseCount.load(), 0);
}

TEST_F(HumanDetectionServiceTest, InitializeLoadsModelWithFixedConfig)
{
	service->initialize();

	EXPECT_EQ(service->getState(), ServiceState::Ready);
	ASSERT_TRUE(loader->lastConfig.has_value());
	EXPECT_EQ(loader->lastConfig->architecture, kModelConfig.architecture);
	EXPECT_EQ(loader->lastConfig->inputWidth, kModelConfig.inputWidth);
	EXPECT_EQ(loader->lastConfig->inputHeight, kModelConfig.inputHeight);
	EXPECT_EQ(loader->lastConfig->precision, kModelConfig.precision);
}

TEST_F(HumanDetectionServiceTest, InitializeChecksReadinessThenSelectsBackend)
{
	service->initialize();

	const std::vector<std::string> expected{"ready", "getBackend", "setBackend:accelerated", "getBackend"};
	std::vector<std::string> calls = backend->log.get();
	ASSERT_GE(calls.size(), expected.size());
	EXPECT_EQ(std::vector<std::string>(calls.begin(), calls.begin() + expected.size()), expected);
}

TEST_F(HumanDetectionServiceTest, SequentialInitializeLoadsOnce)
{
	service->initialize();
	service->initialize();

	EXPECT_EQ(loader->loadCount.load(), 1);
	EXPECT_EQ(service->getState(), ServiceState::Ready);
}

TEST_F(HumanDetectionServiceTest, ConcurrentInitializeLoadsOnce)
{
	loader->holdGate();

	std::exception_ptr firstError, secondError;
	std::thread first([&] {
		try {
			service->initialize();
		} catch (...) {
			firstError = std::current_exception();
		}
	});
	ASSERT_TRUE(loader->waitUntilStarted());
	EXPECT_EQ(service->getState(), ServiceState::Initializing);

	std::thread second([&] {
		try {
			service->initialize();
		} catch (...) {
			secondError = std::current_exception();
		}
	});
	ASSERT_TRUE(logger->waitFor("InitializeJoined"));

	loader->releaseGate();
	first.join();
	second.join();

	EXPECT_FALSE(firstError);
	EXPECT_FALSE(secondError);
	EXPECT_EQ(loader->loadCount.load(), 1);
	EXPECT_EQ(service->getState(), ServiceState::Ready);
}

TEST_F(HumanDetectionServiceTest, ConcurrentInitializeCallersShareFailure)
{
	loader->holdGate();
	loader->failure = std::make_exception_ptr(std::runtime_error("weights missing"));

	std::exception_ptr firstError, secondError;
	std::thread first([&] {
		try {
			service->initialize();
		} catch (...) {
			firstError = std::current_exception();
		}
	});
	ASSERT_TRUE(loader->waitUntilStarted());

	std::thread second([&] {
		try {
			service->initialize();
		} catch (...) {
			secondError = std::current_exception();
		}
	});
	ASSERT_TRUE(logger->waitFor("InitializeJoined"));

	loader->releaseGate();
	first.join();
	second.join();

	ASSERT_TRUE(firstError);
	ASSERT_TRUE(secondError);
	EXPECT_EQ(codeOf(firstError), DetectionErrorCode::ModelLoadFailed);
	EXPECT_EQ(codeOf(secondError), DetectionErrorCode::ModelLoadFailed);
	EXPECT_EQ(firstError, secondError);
	try {
		std::rethrow_exception(secondError);
	} catch (const DetectionError &e) {
		EXPECT_EQ(e.cause(), loader->failure);
		EXPECT_EQ(e.causeMessage(), "weights missing");
	}
	EXPECT_EQ(loader->loadCount.load(), 1);
	EXPECT_EQ(service->getState(), ServiceState::Uninitialized);
}

TEST_F(HumanDetectionServiceTest, LoadFailureWrapsCauseAndAllowsRetry)
{
	auto cause = std::make_exception_ptr(std::runtime_error("weights missing"));
	loader->failure = cause;

	try {
		service->initialize();
		FAIL() << "initialize must fail when the load fails";
	} catch (const DetectionError &e) {
		EXPECT_EQ(e.code(), DetectionErrorCode::ModelLoadFailed);
		EXPECT_EQ(e.cause(), cause);
		EXPECT_EQ(e.causeMessage(), "weights missing");
	}
	EXPECT_EQ(service->getState(), ServiceState::Uninitialized);
	EXPECT_EQ(loader->probe->destroyedCount.load(), 0);

	loader->failure = nullptr;
	service->initialize();

	EXPECT_EQ(service->getState(), ServiceState::Ready);
	EXPECT_EQ(loader->loadCount.load(), 2);
}

TEST_F(HumanDetectionServiceTest, ReadinessFailureIsModelLoadFailed)
{
	backend->failReady = true;

	try {
		service->initialize();
		FAIL() << "initialize must fail when the runtime is not ready";
	} catch (const DetectionError &e) {
		EXPECT_EQ(e.code(), DetectionErrorCode::ModelLoadFailed);
		EXPECT_EQ(e.causeMessage(), "runtime not ready");
	}

	EXPECT_EQ(loader->loadCount.load(), 0);
	EXPECT_EQ(service->getState(), ServiceState::Uninitialized);
}

TEST_F(HumanDetectionServiceTest, BackendSwitchFailuresDoNotFailInitialize)
{
	backend->failAccelerated = true;
	backend->failFallback = true;

	EXPECT_NO_THROW(service->initialize());

	EXPECT_EQ(service->getState(), ServiceState::Ready);
	EXPECT_EQ(loader->loadCount.load(), 1);
}

TEST_F(HumanDetectionServiceTest, NonStandardSwitchFailureDoesNotFailInitialize)
{
	backend->throwNonStandard = true;

	EXPECT_NO_THROW(service->initialize());

	EXPECT_EQ(service->getState(), ServiceState::Ready);
	EXPECT_EQ(loader->loadCount.load(), 1);
	EXPECT_EQ(logger->count("BackendSwitchFailed"), 1u);
}

TEST_F(HumanDetectionServiceTest, BackendQueryFailuresDoNotFailInitialize)
{
	backend->failQueries = true;

	EXPECT_NO_THROW(service->initialize());

	EXPECT_EQ(service->getState(), ServiceState::Ready);
	EXPECT_EQ(loader->loadCount.load(), 1);
}

TEST_F(HumanDetectionServiceTest, DisposeReleasesModelAndBackendResources)
{
	service->initialize();

	service->dispose();

	EXPECT_EQ(service->getState(), ServiceState::Disposed);
	EXPECT_EQ(loader->probe->destroyedCount.load(), 1);
	EXPECT_EQ(backend->releaseCount.load(), 1);

	service->dispose();
	EXPECT_EQ(backend->releaseCount.load(), 1);
}

TEST_F(HumanDetectionServiceTest, InitializeAfterDisposeLoadsAgain)
{
	service->initialize();
	service->dispose();

	service->initialize();

	EXPECT_EQ(loader->loadCount.load(), 2);
	EXPECT_EQ(service->getState(), ServiceState::Ready);
	EXPECT_NO_THROW(service->detectHumans(makeImage(storage, 2, 2)));
}

TEST_F(HumanDetectionServiceTest, DetectAfterDisposeFailsWithNotInitialized)
{
	service->initialize();
	service->dispose();

	try {
		service->detectHumans(makeImage(storage, 2, 2));
		FAIL() << "detectHumans must fail after dispose";
	} catch (const DetectionError &e) {
		EXPECT_EQ(e.code(), DetectionErrorCode::NotInitialized);
	}
	EXPECT_EQ(loader->loadCount.load(), 1);
}

TEST_F(HumanDetectionServiceTest, DisposeWaitsForInFlightInitialize)
{
	loader->holdGate();

	std::exception_ptr initializeError;
	std::thread initializer([&] {
		try {
			service->initialize();
		} catch (...) {
			initializeError = std::current_exception();
		}
	});
	ASSERT_TRUE(loader->waitUntilStarted());

	std::atomic<bool> disposed{false};
	std::thread disposer([&] {
		service->dispose();
		disposed = true;
	});

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	EXPECT_FALSE(disposed.load());

	loader->releaseGate();
	initializer.join();
	disposer.join();

	EXPECT_FALSE(initializeError);
	EXPECT_EQ(service->getState(), ServiceState::Disposed);
	EXPECT_EQ(loader->probe->destroyedCount.load(), 1);
}

TEST_F(HumanDetectionServiceTest, DetectReturnsMaskMatchingInputSize)
{
	loader->probe->behavior = [](const BgraImageView &surface) {
		ClassificationBuffer buffer(surface.getPixelCount(), 0);
		buffer[0] = 1;
		buffer[buffer.size() - 1] = 1;
		return buffer;
	};
	service->initialize();

	DetectionResult result = service->detectHumans(makeImage(storage, 5, 3));

	EXPECT_EQ(result.mask.width, 5u);
	EXPECT_EQ(result.mask.height, 3u);
	ASSERT_EQ(result.mask.pixels.size(), 15u);
	EXPECT_EQ(result.mask.pixels.front(), MaskImage::kForeground);
	EXPECT_EQ(result.mask.pixels.back(), MaskImage::kForeground);
	EXPECT_EQ(result.mask.pixels[7], MaskImage::kBackground);
	EXPECT_DOUBLE_EQ(result.confidence, 2.0 / 15.0);
	EXPECT_GE(result.processingTime.count(), 0.0);
}

TEST_F(HumanDetectionServiceTest, DetectReportsFractionOfHumanPixels)
{
	loader->probe->behavior = [](const BgraImageView &) { return ClassificationBuffer{1, 0, 1, 0}; };
	service->initialize();

	DetectionResult result = service->detectHumans(makeImage(storage, 2, 2));

	EXPECT_EQ(result.confidence, 0.5);
	EXPECT_EQ(result.mask.pixels, (std::vector<std::uint8_t>{255, 0, 255, 0}));
}

TEST_F(HumanDetectionServiceTest, DetectPassesImageCopyAndFixedOptionsToModel)
{
	service->initialize();
	BgraImageView image = makeImage(storage, 3, 2);

	service->detectHumans(image);

	std::lock_guard<std::mutex> lock(loader->probe->mutex);
	EXPECT_EQ(loader->probe->lastSurfaceWidth, 3u);
	EXPECT_EQ(loader->probe->lastSurfaceHeight, 2u);
	EXPECT_EQ(loader->probe->lastSurfaceBytes, storage);
	ASSERT_TRUE(loader->probe->lastOptions.has_value());
	const SegmentationOptions &options = *loader->probe->lastOptions;
	EXPECT_FALSE(options.flipHorizontal);
	EXPECT_EQ(options.internalResolution, InternalResolution::Medium);
	EXPECT_FLOAT_EQ(options.segmentationThreshold, 0.7f);
	EXPECT_EQ(options.maxDetections, 10);
	EXPECT_FLOAT_EQ(options.scoreThreshold, 0.3f);
	EXPECT_EQ(options.nmsRadius, 20);
}

TEST_F(HumanDetectionServiceTest, DetectFailureWrapsCauseAndKeepsServiceReady)
{
	auto failNext = std::make_shared<std::atomic<bool>>(true);
	loader->probe->behavior = [failNext](const BgraImageView &surface) {
		if (failNext->exchange(false))
			throw std::runtime_error("backend lost");
		return ClassificationBuffer(surface.getPixelCount(), 1);
	};
	service->initialize();

	try {
		service->detectHumans(makeImage(storage, 2, 2));
		FAIL() << "detectHumans must fail when segmentation fails";
	} catch (const DetectionError &e) {
		EXPECT_EQ(e.code(), DetectionErrorCode::DetectionFailed);
		EXPECT_EQ(e.causeMessage(), "backend lost");
	}
	EXPECT_EQ(service->getState(), ServiceState::Ready);

	// The scratch surface was given back, so the next frame goes through.
	DetectionResult result = service->detectHumans(makeImage(storage, 2, 2));
	EXPECT_EQ(result.confidence, 1.0);
}

TEST_F(HumanDetectionServiceTest, MalformedImageFailsWithDetectionFailed)
{
	service->initialize();

	try {
		service->detectHumans(BgraImageView{nullptr, 2, 2, 0});
		FAIL() << "detectHumans must reject a null image";
	} catch (const DetectionError &e) {
		EXPECT_EQ(e.code(), DetectionErrorCode::DetectionFailed);
		EXPECT_THROW(std::rethrow_exception(e.cause()), std::invalid_argument);
	}

	EXPECT_EQ(loader->probe->segmentCount.load(), 0);
	EXPECT_EQ(service->getState(), ServiceState::Ready);
}

TEST_F(HumanDetectionServiceTest, DetectCallsAreSerialized)
{
	loader->probe->segmentDelay = std::chrono::milliseconds(10);
	service->initialize();

	std::vector<std::thread> threads;
	std::atomic<int> failures{0};
	for (int i = 0; i < 4; i++) {
		threads.emplace_back([&] {
			std::vector<std::uint8_t> pixels;
			try {
				service->detectHumans(makeImage(pixels, 8, 8));
			} catch (const DetectionError &) {
				failures++;
			}
		});
	}
	for (std::thread &thread : threads) {
		thread.join();
	}

	EXPECT_EQ(failures.load(), 0);
	EXPECT_EQ(loader->probe->segmentCount.load(), 4);
	EXPECT_EQ(loader->probe->maxInFlight.load(), 1);
}

TEST_F(HumanDetectionServiceTest, DestructionReleasesModel)
{
	service->initialize();

	service.reset();

	EXPECT_EQ(loader->probe->destroyedCount.load(), 1);
	EXPECT_EQ(backend->releaseCount.load(), 1);
}

TEST(HumanDetectionServiceConstructionTest, RejectsMissingCollaborators)
{
	auto logger = std::make_shared<NullLogger>();
	auto backend = std::make_shared<FakeComputeBackend>();
	auto loader = std::make_shared<FakeModelLoader>();

	EXPECT_THROW(std::make_unique<HumanDetectionService>(nullptr, backend, loader), std::invalid_argument);
	EXPECT_THROW(std::make_unique<HumanDetectionService>(logger, nullptr, loader), std::invalid_argument);
	EXPECT_THROW(std::make_unique<HumanDetectionService>(logger, backend, nullptr), std::invalid_argument);
}
