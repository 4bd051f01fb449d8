/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <StreamStudio/Logger/ILogger.hpp>

namespace StreamStudio::HumanDetection {

struct ServiceConfig {
	std::string modelParamPath;
	std::string modelBinPath;
	int numThreads = 1;
	std::string logLevel = "info";

	/**
	 * @brief Defaults with the model files resolved under dataDir/models.
	 */
	static ServiceConfig makeDefault(const std::filesystem::path &dataDir);

	/**
	 * @brief Reads a JSON config file on top of makeDefault(dataDir).
	 *
	 * A missing or unparsable file yields the defaults. Keys with the wrong
	 * type are logged and skipped.
	 */
	static ServiceConfig load(const std::filesystem::path &configPath, const std::filesystem::path &dataDir,
				  const Logger::ILogger &logger);
};

} // namespace StreamStudio::HumanDetection
