#include "GemLink/Logging.h"

#include <memory>
#include <utility>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace GemLink::Logging
{
	void SetupLogging(
		const std::optional<std::filesystem::path>& a_logFile,
		spdlog::level::level_enum a_level)
	{
		spdlog::sink_ptr sink;
		if (a_logFile) {
			try {
				sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(a_logFile->string(), true);
			} catch (const spdlog::spdlog_ex& e) {
				spdlog::warn("GemLink: cannot open log file {} ({}); logging to stdout.", a_logFile->string(), e.what());
			}
		}
		if (!sink) {
			sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
		}

		auto logger = std::make_shared<spdlog::logger>("", std::move(sink));
		spdlog::set_default_logger(std::move(logger));
		spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
		spdlog::set_level(a_level);
		spdlog::flush_on(spdlog::level::info);
	}
}
