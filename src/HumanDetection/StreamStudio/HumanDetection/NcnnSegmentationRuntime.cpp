/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "NcnnSegmentationRuntime.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#ifdef STREAMSTUDIO_PREFIXED_NCNN_HEADERS
#include <ncnn/cpu.h>
#include <ncnn/gpu.h>
#else
#include <cpu.h>
#include <gpu.h>
#endif

namespace StreamStudio::HumanDetection {

namespace {

std::mutex gpuInstanceMutex;
int gpuInstanceShareCount = 0;

#if NCNN_VULKAN
void dropGpuInstanceShare(int *) noexcept
{
	std::lock_guard<std::mutex> lock(gpuInstanceMutex);
	if (--gpuInstanceShareCount == 0) {
		ncnn::destroy_gpu_instance();
	}
}

NcnnGpuInstanceShare takeGpuInstanceShare()
{
	std::lock_guard<std::mutex> lock(gpuInstanceMutex);
	if (gpuInstanceShareCount == 0) {
		if (int ret = ncnn::create_gpu_instance()) {
			throw std::runtime_error("Failed to create ncnn GPU instance: " + std::to_string(ret));
		}
	}
	++gpuInstanceShareCount;
	return NcnnGpuInstanceShare(&gpuInstanceShareCount, dropGpuInstanceShare);
}
#endif

} // anonymous namespace

NcnnComputeBackend::NcnnComputeBackend(std::shared_ptr<const Logger::ILogger> logger)
	: logger_(logger ? std::move(logger) : throw std::invalid_argument("logger must not be null"))
{
}

NcnnComputeBackend::~NcnnComputeBackend() noexcept
{
	releaseResources();
}

void NcnnComputeBackend::ready()
{
	if (ncnn::get_cpu_count() <= 0) {
		throw std::runtime_error("ncnn reports no usable CPU");
	}
}

ComputeBackend NcnnComputeBackend::getBackend() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return backend_;
}

void NcnnComputeBackend::setBackend(ComputeBackend backend)
{
	std::lock_guard<std::mutex> lock(mutex_);

	if (backend == ComputeBackend::Fallback) {
		backend_ = ComputeBackend::Fallback;
		return;
	}

#if NCNN_VULKAN
	NcnnGpuInstanceShare gpuInstance = gpuInstance_ ? gpuInstance_ : takeGpuInstanceShare();

	if (ncnn::get_gpu_count() <= 0) {
		throw std::runtime_error("No Vulkan device available");
	}

	gpuInstance_ = std::move(gpuInstance);
	backend_ = ComputeBackend::Accelerated;
	logger_->info("Using Vulkan device {} for segmentation", ncnn::get_default_gpu_index());
#else
	throw std::runtime_error("ncnn was built without Vulkan support");
#endif
}

void NcnnComputeBackend::releaseResources() noexcept
{
	std::lock_guard<std::mutex> lock(mutex_);
	gpuInstance_.reset();
	backend_ = ComputeBackend::Fallback;
}

NcnnGpuInstanceShare NcnnComputeBackend::getGpuInstance() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return backend_ == ComputeBackend::Accelerated ? gpuInstance_ : nullptr;
}

int NcnnComputeBackend::getGpuInstanceShareCount() noexcept
{
	std::lock_guard<std::mutex> lock(gpuInstanceMutex);
	return gpuInstanceShareCount;
}

NcnnSegmentationModel::NcnnSegmentationModel(const std::string &paramPath, const std::string &binPath,
					     const ModelConfig &config, NcnnGpuInstanceShare gpuInstance, int numThreads)
	: config_(config),
	  gpuInstance_(std::move(gpuInstance))
{
	net_.opt.num_threads = numThreads;
	net_.opt.use_local_pool_allocator = true;
	net_.opt.openmp_blocktime = 1;
	net_.opt.use_vulkan_compute = gpuInstance_ != nullptr;

	const bool fp16 = config.precision == ModelPrecision::Float16;
	net_.opt.use_fp16_packed = fp16;
	net_.opt.use_fp16_storage = fp16;
	net_.opt.use_fp16_arithmetic = fp16;
	net_.opt.use_int8_inference = config.precision == ModelPrecision::Int8;

	if (int ret = net_.load_param(paramPath.c_str())) {
		throw std::runtime_error("Failed to load segmentation param " + paramPath + ": " + std::to_string(ret));
	}

	if (int ret = net_.load_model(binPath.c_str())) {
		throw std::runtime_error("Failed to load segmentation bin " + binPath + ": " + std::to_string(ret));
	}
}

ClassificationBuffer NcnnSegmentationModel::segmentPerson(const BgraImageView &surface,
							  const SegmentationOptions &options)
{
	if (!surface.isWellFormed()) {
		throw std::invalid_argument("NcnnSegmentationModel::segmentPerson received a malformed surface");
	}

	const int inputWidth = static_cast<int>(config_.inputWidth);
	const int inputHeight = static_cast<int>(config_.inputHeight);

	ncnn::Mat inputMat = ncnn::Mat::from_pixels_resize(
		surface.data, ncnn::Mat::PIXEL_BGRA2RGB, static_cast<int>(surface.width),
		static_cast<int>(surface.height), static_cast<int>(surface.getStride()), inputWidth, inputHeight);
	if (inputMat.empty()) {
		throw std::runtime_error("Failed to create segmentation input mat");
	}

	const float normVals[3] = {1.0f / 255.0f, 1.0f / 255.0f, 1.0f / 255.0f};
	inputMat.substract_mean_normalize(nullptr, normVals);

	ncnn::Extractor ex = net_.create_extractor();
	if (int ret = ex.input("in0", inputMat)) {
		throw std::runtime_error("Failed to feed segmentation input: " + std::to_string(ret));
	}
	if (int ret = ex.extract("out0", outputMat_)) {
		throw std::runtime_error("Failed to extract segmentation output: " + std::to_string(ret));
	}

	if (outputMat_.w != inputWidth || outputMat_.h != inputHeight) {
		throw std::runtime_error("Unexpected segmentation output shape " + std::to_string(outputMat_.w) + "x" +
					 std::to_string(outputMat_.h));
	}

	// The network is single-person with a fixed input shape, so maxDetections,
	// nmsRadius and internalResolution have nothing to act on here.
	const float *probabilities = outputMat_.channel(0);
	const std::size_t outputPixelCount = config_.inputWidth * config_.inputHeight;

	ClassificationBuffer classification(surface.getPixelCount(), 0);

	const float peak = *std::max_element(probabilities, probabilities + outputPixelCount);
	if (peak < options.scoreThreshold) {
		return classification;
	}

	for (std::size_t y = 0; y < surface.height; y++) {
		const std::size_t sy = y * config_.inputHeight / surface.height;
		const float *row = probabilities + sy * config_.inputWidth;
		std::uint8_t *dst = classification.data() + y * surface.width;
		for (std::size_t x = 0; x < surface.width; x++) {
			std::size_t sx = x * config_.inputWidth / surface.width;
			if (options.flipHorizontal) {
				sx = config_.inputWidth - 1 - sx;
			}
			dst[x] = row[sx] >= options.segmentationThreshold ? 1 : 0;
		}
	}

	return classification;
}

NcnnModelLoader::NcnnModelLoader(std::shared_ptr<const Logger::ILogger> logger,
				 std::shared_ptr<const NcnnComputeBackend> backend, std::string paramPath,
				 std::string binPath, int numThreads)
	: logger_(logger ? std::move(logger) : throw std::invalid_argument("logger must not be null")),
	  backend_(backend ? std::move(backend) : throw std::invalid_argument("backend must not be null")),
	  paramPath_(std::move(paramPath)),
	  binPath_(std::move(binPath)),
	  numThreads_(numThreads > 0 ? numThreads : throw std::invalid_argument("numThreads must be greater than 0"))
{
}

std::unique_ptr<ISegmentationModel> NcnnModelLoader::load(const ModelConfig &config)
{
	NcnnGpuInstanceShare gpuInstance = backend_->getGpuInstance();
	const ComputeBackend backend = gpuInstance ? ComputeBackend::Accelerated : ComputeBackend::Fallback;

	logger_->info("ModelLoading", {{"param", paramPath_},
				       {"bin", binPath_},
				       {"precision", toString(config.precision)},
				       {"backend", toString(backend)}});

	return std::make_unique<NcnnSegmentationModel>(paramPath_, binPath_, config, std::move(gpuInstance),
						       numThreads_);
}

} // namespace StreamStudio::HumanDetection
