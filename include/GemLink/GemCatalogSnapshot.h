#pragma once

#include "GemLink/GemTemplate.h"
#include "GemLink/SocketColor.h"
#include "GemLink/StatBlock.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace GemLink
{
	struct GemCatalogRow
	{
		std::string id{};
		std::string name{};
		GemKind kind{ GemKind::kActive };
		GemRequirements requirements{};
		StatBlock stats{};
		std::string description{};
		std::vector<std::string> tags{};
		std::uint32_t maxLevel{ kDefaultMaxGemLevel };
		std::uint32_t maxQuality{ kDefaultMaxGemQuality };
	};

	struct ClassStarterRow
	{
		std::string className{};
		std::vector<std::string> gemIds{};
	};

	struct GemCatalogSnapshot
	{
		std::vector<GemCatalogRow> gems{};
		std::vector<ClassStarterRow> classStarters{};
	};

	// Whole-file validation: any malformed row rejects the snapshot.
	[[nodiscard]] bool ParseGemCatalogSnapshot(
		const nlohmann::json& a_root,
		std::string_view a_sourceLabel,
		GemCatalogSnapshot& a_outSnapshot);

	[[nodiscard]] bool LoadGemCatalogSnapshot(
		const std::filesystem::path& a_path,
		GemCatalogSnapshot& a_outSnapshot);

	[[nodiscard]] bool LoadGemCatalogSnapshotFromRuntime(
		std::string_view a_relativePath,
		GemCatalogSnapshot& a_outSnapshot);

	// Compiled fallback catalog used when no catalog file is available.
	[[nodiscard]] GemCatalogSnapshot MakeBuiltInGemCatalogSnapshot();
}
