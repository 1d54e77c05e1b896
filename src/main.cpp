#include "GemLink/GemCatalogSnapshot.h"
#include "GemLink/GemStateSerialization.h"
#include "GemLink/GemTemplateRegistry.h"
#include "GemLink/LinkResolver.h"
#include "GemLink/Logging.h"
#include "GemLink/SkillEligibility.h"
#include "GemLink/StatCompositor.h"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace
{
	constexpr std::string_view kUsage =
		"usage: gemlink_inspect [--catalog <file>] [--log <file>] [--debug] "
		"(<layout.json> | --search <query> | --class <name>)";

	struct InspectOptions
	{
		std::optional<std::filesystem::path> catalogPath{};
		std::optional<std::filesystem::path> logPath{};
		std::optional<std::filesystem::path> layoutPath{};
		std::optional<std::string> searchQuery{};
		std::optional<std::string> className{};
		bool debug{ false };
	};

	[[nodiscard]] bool ParseArguments(int a_argc, char** a_argv, InspectOptions& a_outOptions)
	{
		for (int i = 1; i < a_argc; ++i) {
			const std::string_view arg{ a_argv[i] };
			const bool hasValue = i + 1 < a_argc;

			if (arg == "--debug") {
				a_outOptions.debug = true;
			} else if (arg == "--catalog" && hasValue) {
				a_outOptions.catalogPath = std::filesystem::path(a_argv[++i]);
			} else if (arg == "--log" && hasValue) {
				a_outOptions.logPath = std::filesystem::path(a_argv[++i]);
			} else if (arg == "--search" && hasValue) {
				a_outOptions.searchQuery = std::string(a_argv[++i]);
			} else if (arg == "--class" && hasValue) {
				a_outOptions.className = std::string(a_argv[++i]);
			} else if (!arg.starts_with("--") && !a_outOptions.layoutPath) {
				a_outOptions.layoutPath = std::filesystem::path(arg);
			} else {
				return false;
			}
		}

		return a_outOptions.layoutPath || a_outOptions.searchQuery || a_outOptions.className;
	}

	[[nodiscard]] bool ReadJsonFile(const std::filesystem::path& a_path, nlohmann::json& a_outRoot)
	{
		std::ifstream in(a_path, std::ios::binary);
		if (!in.is_open()) {
			spdlog::error("GemLink: cannot open {}.", a_path.string());
			return false;
		}

		try {
			in >> a_outRoot;
		} catch (const std::exception& e) {
			spdlog::error("GemLink: parse failed at {} ({}).", a_path.string(), e.what());
			return false;
		}
		return true;
	}

	void LogTemplates(std::string_view a_title, const std::vector<GemLink::GemTemplate>& a_templates)
	{
		spdlog::info("{} ({} gems)", a_title, a_templates.size());
		for (const auto& gemTemplate : a_templates) {
			spdlog::info(
				"  {} [{}] {} socket={}",
				gemTemplate.id,
				GemLink::DescribeGemKind(gemTemplate.kind),
				gemTemplate.name,
				GemLink::DescribeSocketColor(gemTemplate.socketColor));
		}
	}

	void LogStats(const GemLink::StatBlock& a_stats)
	{
		a_stats.ForEach([](GemLink::StatKey a_key, double a_value) {
			spdlog::info("    {} = {:.4f}", GemLink::StatName(a_key), a_value);
		});
	}

	[[nodiscard]] int InspectLayout(const GemLink::GemTemplateRegistry& a_registry, const std::filesystem::path& a_layoutPath)
	{
		nlohmann::json root = nlohmann::json::object();
		if (!ReadJsonFile(a_layoutPath, root)) {
			return 1;
		}

		GemLink::SocketGroupRecord record{};
		if (!GemLink::FromJson(root, record)) {
			spdlog::error("GemLink: {} is not a valid socket layout.", a_layoutPath.string());
			return 1;
		}

		GemLink::CharacterSnapshot character{};
		if (const auto it = root.find("character"); it != root.end() && !GemLink::FromJson(*it, character)) {
			spdlog::error("GemLink: {} has an invalid character block.", a_layoutPath.string());
			return 1;
		}

		GemLink::SocketGroup group{};
		if (const auto result = GemLink::RestoreSocketGroup(a_registry, record, group); !result) {
			spdlog::error("GemLink: layout restore failed: {}.", GemLink::DescribeGemError(result.code));
			return 1;
		}

		const auto setups = GemLink::ActiveSkillSetups(group);
		spdlog::info("{}: {} sockets, {} links, {} skill setups", a_layoutPath.string(), group.SocketCount(), group.GetLinks().size(), setups.size());

		for (const auto& setup : setups) {
			std::string supports;
			for (const auto* support : setup.supportGems) {
				if (!supports.empty()) {
					supports += ", ";
				}
				supports += support->TemplateId();
			}

			const auto usable = GemLink::EvaluateSkillUse(setup, character);
			spdlog::info(
				"  socket {}: {} (level {}, quality {}) supports=[{}] cost={:.2f} usable={}",
				setup.socketIndex,
				setup.activeGem->TemplateId(),
				setup.activeGem->Level(),
				setup.activeGem->Quality(),
				supports,
				GemLink::ComputeEligibilityCost(setup),
				usable ? std::string_view{ "yes" } : GemLink::DescribeGemError(usable.code));
			LogStats(GemLink::CalculateSkillDamage(setup, character));
		}
		return 0;
	}
}

int main(int argc, char** argv)
{
	InspectOptions options{};
	if (!ParseArguments(argc, argv, options)) {
		GemLink::Logging::SetupLogging(std::nullopt);
		spdlog::error("{}", kUsage);
		return 2;
	}

	GemLink::Logging::SetupLogging(options.logPath, options.debug ? spdlog::level::debug : spdlog::level::info);

	GemLink::GemTemplateRegistry customRegistry{};
	const GemLink::GemTemplateRegistry* registry = nullptr;
	if (options.catalogPath) {
		GemLink::GemCatalogSnapshot snapshot{};
		if (!GemLink::LoadGemCatalogSnapshot(*options.catalogPath, snapshot) || !customRegistry.LoadSnapshot(snapshot)) {
			spdlog::error("GemLink: catalog {} rejected.", options.catalogPath->string());
			return 1;
		}
		registry = &customRegistry;
	} else {
		registry = &GemLink::GemTemplateRegistry::GetSingleton();
	}
	spdlog::debug("GemLink: registry holds {} templates.", registry->Size());

	if (options.searchQuery) {
		LogTemplates("search '" + *options.searchQuery + "'", registry->Search(*options.searchQuery));
	}
	if (options.className) {
		LogTemplates("class '" + *options.className + "'", registry->GemsForClass(*options.className));
	}
	if (options.layoutPath) {
		return InspectLayout(*registry, *options.layoutPath);
	}
	return 0;
}
