/*
 * StreamStudio hdseg
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

#include <fmt/format.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <StreamStudio/HumanDetection/DetectionError.hpp>
#include <StreamStudio/HumanDetection/HumanDetectionService.hpp>
#include <StreamStudio/HumanDetection/NcnnSegmentationRuntime.hpp>
#include <StreamStudio/HumanDetection/ServiceConfig.hpp>
#include <StreamStudio/Logger/FmtLogger.hpp>

using namespace StreamStudio;
using namespace StreamStudio::HumanDetection;

#ifndef STREAMSTUDIO_DATA_DIR
#define STREAMSTUDIO_DATA_DIR "data"
#endif

namespace {

int run(const std::string &inputPath, const std::string &outputPath, const std::filesystem::path &configPath)
{
	Logger::FmtLogger bootstrapLogger("[hdseg]");
	const ServiceConfig config = ServiceConfig::load(configPath, STREAMSTUDIO_DATA_DIR, bootstrapLogger);

	auto logLevel = Logger::parseLogLevel(config.logLevel);
	if (!logLevel) {
		bootstrapLogger.warn("Unknown logLevel '{}', using info", config.logLevel);
	}
	auto logger = std::make_shared<Logger::FmtLogger>("[hdseg]", logLevel.value_or(Logger::LogLevel::Info));

	cv::Mat bgrImage = cv::imread(inputPath, cv::IMREAD_COLOR);
	if (bgrImage.empty()) {
		logger->error("ImageReadError", {{"path", inputPath}});
		return EXIT_FAILURE;
	}
	cv::Mat bgraImage;
	cv::cvtColor(bgrImage, bgraImage, cv::COLOR_BGR2BGRA);

	auto backend = std::make_shared<NcnnComputeBackend>(logger);
	auto loader = std::make_shared<NcnnModelLoader>(logger, backend, config.modelParamPath, config.modelBinPath,
							config.numThreads);
	HumanDetectionService service(logger, backend, loader);

	try {
		service.initialize();

		BgraImageView image{bgraImage.data, static_cast<std::size_t>(bgraImage.cols),
				    static_cast<std::size_t>(bgraImage.rows), bgraImage.step[0]};
		DetectionResult result = service.detectHumans(image);

		cv::Mat mask(static_cast<int>(result.mask.height), static_cast<int>(result.mask.width), CV_8UC1,
			     result.mask.pixels.data());
		if (!cv::imwrite(outputPath, mask)) {
			logger->error("ImageWriteError", {{"path", outputPath}});
			service.dispose();
			return EXIT_FAILURE;
		}

		logger->info("DetectionSucceeded", {{"confidence", fmt::format("{:.4f}", result.confidence)},
						    {"processingTimeMs",
						     fmt::format("{:.2f}", result.processingTime.count())},
						    {"output", outputPath}});
	} catch (const DetectionError &e) {
		logger->error("DetectionServiceError",
			      {{"code", toString(e.code())}, {"message", e.what()}, {"cause", e.causeMessage()}});
		service.dispose();
		return EXIT_FAILURE;
	}

	service.dispose();
	return EXIT_SUCCESS;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
	if (argc < 3 || argc > 4) {
		fmt::print(stderr, "usage: {} <input-image> <output-mask.png> [config.json]\n", argv[0]);
		return EXIT_FAILURE;
	}

	const std::filesystem::path configPath = argc == 4 ? argv[3] : "hdseg.json";

	try {
		return run(argv[1], argv[2], configPath);
	} catch (const std::exception &e) {
		Logger::FmtLogger logger("[hdseg]");
		logger.logException(e, "UnhandledError");
		return EXIT_FAILURE;
	}
}
