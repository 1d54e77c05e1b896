#include "GemLink/GemCatalogSnapshot.h"

#include "GemLink/GemCatalogContract.h"
#include "GemLink/RuntimePaths.h"

#include <fstream>
#include <limits>
#include <string>
#include <unordered_set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace GemLink
{
	namespace
	{
		[[nodiscard]] bool TryReadRequiredString(
			const nlohmann::json& a_object,
			std::string_view a_key,
			std::string& a_outValue)
		{
			const auto it = a_object.find(std::string(a_key));
			if (it == a_object.end() || !it->is_string()) {
				return false;
			}

			a_outValue = it->get<std::string>();
			return !a_outValue.empty();
		}

		[[nodiscard]] bool TryReadOptionalUInt(
			const nlohmann::json& a_object,
			std::string_view a_key,
			std::uint32_t& a_inOutValue)
		{
			const auto it = a_object.find(std::string(a_key));
			if (it == a_object.end() || it->is_null()) {
				return true;
			}
			if (!it->is_number_integer()) {
				return false;
			}

			const auto value = it->get<std::int64_t>();
			if (value < 0 || value > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
				return false;
			}
			a_inOutValue = static_cast<std::uint32_t>(value);
			return true;
		}

		[[nodiscard]] bool ParseRequirements(const nlohmann::json& a_entry, GemRequirements& a_outRequirements)
		{
			a_outRequirements = {};

			const auto it = a_entry.find(std::string(GemCatalogContract::kFieldGemRequirements));
			if (it == a_entry.end() || it->is_null()) {
				return true;
			}
			if (!it->is_object()) {
				return false;
			}

			return TryReadOptionalUInt(*it, GemCatalogContract::kFieldRequirementLevel, a_outRequirements.level) &&
			       TryReadOptionalUInt(*it, GemCatalogContract::kFieldRequirementStrength, a_outRequirements.strength) &&
			       TryReadOptionalUInt(*it, GemCatalogContract::kFieldRequirementDexterity, a_outRequirements.dexterity) &&
			       TryReadOptionalUInt(*it, GemCatalogContract::kFieldRequirementIntelligence, a_outRequirements.intelligence);
		}

		[[nodiscard]] bool ParseStats(const nlohmann::json& a_entry, std::string_view a_gemId, StatBlock& a_outStats)
		{
			a_outStats = {};

			const auto it = a_entry.find(std::string(GemCatalogContract::kFieldGemStats));
			if (it == a_entry.end() || !it->is_object()) {
				return false;
			}

			for (const auto& [name, value] : it->items()) {
				const auto key = FindStatKey(name);
				if (!key) {
					spdlog::warn("GemLink: gem '{}' has unknown stat '{}'.", a_gemId, name);
					return false;
				}
				if (!value.is_number()) {
					spdlog::warn("GemLink: gem '{}' stat '{}' is not numeric.", a_gemId, name);
					return false;
				}
				a_outStats.Set(*key, value.get<double>());
			}
			return true;
		}

		[[nodiscard]] bool ParseStringArray(
			const nlohmann::json& a_entry,
			std::string_view a_key,
			bool a_required,
			std::vector<std::string>& a_outValues)
		{
			a_outValues.clear();

			const auto it = a_entry.find(std::string(a_key));
			if (it == a_entry.end() || it->is_null()) {
				return !a_required;
			}
			if (!it->is_array()) {
				return false;
			}

			a_outValues.reserve(it->size());
			for (const auto& value : *it) {
				if (!value.is_string()) {
					return false;
				}
				auto text = value.get<std::string>();
				if (text.empty()) {
					return false;
				}
				a_outValues.push_back(std::move(text));
			}
			return true;
		}

		[[nodiscard]] bool ParseGemRow(const nlohmann::json& a_entry, GemKind a_kind, GemCatalogRow& a_outRow)
		{
			if (!a_entry.is_object()) {
				return false;
			}

			a_outRow = {};
			a_outRow.kind = a_kind;

			if (!TryReadRequiredString(a_entry, GemCatalogContract::kFieldGemId, a_outRow.id) ||
			    !TryReadRequiredString(a_entry, GemCatalogContract::kFieldGemName, a_outRow.name)) {
				return false;
			}

			if (const auto descIt = a_entry.find(std::string(GemCatalogContract::kFieldGemDescription));
				descIt != a_entry.end() && !descIt->is_null()) {
				if (!descIt->is_string()) {
					return false;
				}
				a_outRow.description = descIt->get<std::string>();
			}

			return ParseRequirements(a_entry, a_outRow.requirements) &&
			       ParseStats(a_entry, a_outRow.id, a_outRow.stats) &&
			       ParseStringArray(a_entry, GemCatalogContract::kFieldGemTags, false, a_outRow.tags) &&
			       TryReadOptionalUInt(a_entry, GemCatalogContract::kFieldGemMaxLevel, a_outRow.maxLevel) &&
			       TryReadOptionalUInt(a_entry, GemCatalogContract::kFieldGemMaxQuality, a_outRow.maxQuality) &&
			       a_outRow.maxLevel >= 1u;
		}

		[[nodiscard]] bool ParseGemArray(
			const nlohmann::json& a_root,
			std::string_view a_field,
			GemKind a_kind,
			std::string_view a_sourceLabel,
			std::unordered_set<std::string>& a_seenIds,
			std::vector<GemCatalogRow>& a_outRows)
		{
			const auto it = a_root.find(std::string(a_field));
			if (it == a_root.end() || !it->is_array()) {
				spdlog::warn("GemLink: gem catalog missing '{}' array in {}.", a_field, a_sourceLabel);
				return false;
			}

			for (const auto& entry : *it) {
				GemCatalogRow row{};
				if (!ParseGemRow(entry, a_kind, row)) {
					spdlog::warn("GemLink: invalid gem entry in '{}' at {}.", a_field, a_sourceLabel);
					return false;
				}
				if (!a_seenIds.insert(row.id).second) {
					spdlog::warn("GemLink: duplicate gem id '{}' in {}.", row.id, a_sourceLabel);
					return false;
				}
				a_outRows.push_back(std::move(row));
			}
			return true;
		}
	}

	bool ParseGemCatalogSnapshot(
		const nlohmann::json& a_root,
		std::string_view a_sourceLabel,
		GemCatalogSnapshot& a_outSnapshot)
	{
		a_outSnapshot = {};

		if (!a_root.is_object()) {
			spdlog::warn("GemLink: gem catalog root is not an object in {}.", a_sourceLabel);
			return false;
		}

		GemCatalogSnapshot snapshot{};
		std::unordered_set<std::string> seenIds;
		if (!ParseGemArray(a_root, GemCatalogContract::kFieldActiveGems, GemKind::kActive, a_sourceLabel, seenIds, snapshot.gems) ||
		    !ParseGemArray(a_root, GemCatalogContract::kFieldSupportGems, GemKind::kSupport, a_sourceLabel, seenIds, snapshot.gems)) {
			return false;
		}
		if (snapshot.gems.empty()) {
			spdlog::warn("GemLink: gem catalog has no gems in {}.", a_sourceLabel);
			return false;
		}

		const auto startersIt = a_root.find(std::string(GemCatalogContract::kFieldClassStarterGems));
		if (startersIt != a_root.end() && !startersIt->is_null()) {
			if (!startersIt->is_array()) {
				spdlog::warn("GemLink: '{}' is not an array in {}.", GemCatalogContract::kFieldClassStarterGems, a_sourceLabel);
				return false;
			}

			for (const auto& entry : *startersIt) {
				ClassStarterRow row{};
				if (!entry.is_object() ||
				    !TryReadRequiredString(entry, GemCatalogContract::kFieldStarterClass, row.className) ||
				    !ParseStringArray(entry, GemCatalogContract::kFieldStarterGems, true, row.gemIds)) {
					spdlog::warn("GemLink: invalid class starter entry in {}.", a_sourceLabel);
					return false;
				}

				for (const auto& gemId : row.gemIds) {
					if (seenIds.find(gemId) == seenIds.end()) {
						spdlog::warn(
							"GemLink: class '{}' references unknown gem '{}' in {}.",
							row.className,
							gemId,
							a_sourceLabel);
						return false;
					}
				}
				snapshot.classStarters.push_back(std::move(row));
			}
		}

		a_outSnapshot = std::move(snapshot);
		return true;
	}

	bool LoadGemCatalogSnapshot(
		const std::filesystem::path& a_path,
		GemCatalogSnapshot& a_outSnapshot)
	{
		a_outSnapshot = {};

		std::ifstream in(a_path, std::ios::binary);
		if (!in.is_open()) {
			spdlog::warn("GemLink: gem catalog missing at {}.", a_path.string());
			return false;
		}

		nlohmann::json root = nlohmann::json::object();
		try {
			in >> root;
		} catch (const std::exception& e) {
			spdlog::warn("GemLink: gem catalog parse failed at {} ({}).", a_path.string(), e.what());
			return false;
		}

		return ParseGemCatalogSnapshot(root, a_path.string(), a_outSnapshot);
	}

	bool LoadGemCatalogSnapshotFromRuntime(
		std::string_view a_relativePath,
		GemCatalogSnapshot& a_outSnapshot)
	{
		return LoadGemCatalogSnapshot(RuntimePaths::ResolveRuntimeRelativePath(a_relativePath), a_outSnapshot);
	}
}
