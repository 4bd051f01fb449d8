/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ServiceConfig.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace StreamStudio::HumanDetection {

namespace {

constexpr char kParamFileName[] = "mediapipe_selfie_segmentation_landscape_int8.ncnn.param";
constexpr char kBinFileName[] = "mediapipe_selfie_segmentation_landscape_int8.ncnn.bin";

template<typename T>
void readKey(const nlohmann::json &data, const char *key, T &out, const Logger::ILogger &logger)
{
	auto it = data.find(key);
	if (it == data.end()) {
		return;
	}

	try {
		out = it->get<T>();
		logger.info("Loaded {} from config", key);
	} catch (const nlohmann::json::exception &e) {
		logger.warn("ConfigKeyTypeError", {{"key", key}, {"message", e.what()}});
	}
}

} // anonymous namespace

ServiceConfig ServiceConfig::makeDefault(const std::filesystem::path &dataDir)
{
	ServiceConfig config;
	config.modelParamPath = (dataDir / "models" / kParamFileName).string();
	config.modelBinPath = (dataDir / "models" / kBinFileName).string();
	return config;
}

ServiceConfig ServiceConfig::load(const std::filesystem::path &configPath, const std::filesystem::path &dataDir,
				  const Logger::ILogger &logger)
{
	ServiceConfig config = makeDefault(dataDir);

	std::ifstream ifs(configPath);
	if (!ifs.is_open()) {
		logger.info("No config file found at {}, using default configuration", configPath.string());
		return config;
	}

	nlohmann::json data = nlohmann::json::parse(ifs, nullptr, false);
	if (data.is_discarded() || !data.is_object()) {
		logger.warn("ConfigParseError", {{"path", configPath.string()}});
		return config;
	}

	readKey(data, "modelParamPath", config.modelParamPath, logger);
	readKey(data, "modelBinPath", config.modelBinPath, logger);
	readKey(data, "numThreads", config.numThreads, logger);
	readKey(data, "logLevel", config.logLevel, logger);

	return config;
}

} // namespace StreamStudio::HumanDetection
