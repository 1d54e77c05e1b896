#pragma once

#include <filesystem>
#include <optional>

#include <spdlog/common.h>

namespace GemLink::Logging
{
	// Installs the default spdlog logger. Writes to a_logFile when given (truncated), else to colored stdout.
	void SetupLogging(
		const std::optional<std::filesystem::path>& a_logFile,
		spdlog::level::level_enum a_level = spdlog::level::info);
}
