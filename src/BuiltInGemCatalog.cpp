#include "GemLink/GemCatalogSnapshot.h"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace GemLink
{
	namespace
	{
		struct BuiltInGemRow
		{
			std::string_view id{};
			std::string_view name{};
			GemKind kind{ GemKind::kActive };
			GemRequirements requirements{};
			StatBlock stats{};
			std::string_view description{};
			std::string_view tagCsv{};
		};

		struct BuiltInClassRow
		{
			std::string_view className{};
			std::string_view gemCsv{};
		};

		constexpr std::array<BuiltInGemRow, 17> kBuiltInGemRows{ {
#include "BuiltInGemCatalogRows.inl"
		} };

		constexpr std::array<BuiltInClassRow, 7> kBuiltInClassRows{ {
			{ "Marauder", "heavy_strike,double_strike,melee_physical_damage,added_fire_damage" },
			{ "Ranger", "burning_arrow,split_arrow,pierce,critical_strikes" },
			{ "Witch", "fireball,ice_nova,lightning_bolt,faster_casting,added_cold_damage" },
			{ "Duelist", "heavy_strike,double_strike,melee_physical_damage,critical_strikes" },
			{ "Templar", "heavy_strike,fireball,added_fire_damage,faster_casting" },
			{ "Shadow", "lightning_bolt,burning_arrow,critical_strikes,faster_casting" },
			{ "Scion", "fireball,heavy_strike,burning_arrow,faster_casting" },
		} };

		[[nodiscard]] std::vector<std::string> SplitCsv(std::string_view a_csv)
		{
			std::vector<std::string> out;
			while (!a_csv.empty()) {
				const auto pos = a_csv.find(',');
				const auto token = (pos == std::string_view::npos) ? a_csv : a_csv.substr(0, pos);
				if (!token.empty()) {
					out.emplace_back(token);
				}
				if (pos == std::string_view::npos) {
					break;
				}
				a_csv.remove_prefix(pos + 1);
			}
			return out;
		}
	}

	GemCatalogSnapshot MakeBuiltInGemCatalogSnapshot()
	{
		GemCatalogSnapshot snapshot{};
		snapshot.gems.reserve(kBuiltInGemRows.size());
		for (const auto& row : kBuiltInGemRows) {
			snapshot.gems.push_back(GemCatalogRow{
				.id = std::string(row.id),
				.name = std::string(row.name),
				.kind = row.kind,
				.requirements = row.requirements,
				.stats = row.stats,
				.description = std::string(row.description),
				.tags = SplitCsv(row.tagCsv),
				.maxLevel = kDefaultMaxGemLevel,
				.maxQuality = kDefaultMaxGemQuality });
		}

		snapshot.classStarters.reserve(kBuiltInClassRows.size());
		for (const auto& row : kBuiltInClassRows) {
			snapshot.classStarters.push_back(ClassStarterRow{
				.className = std::string(row.className),
				.gemIds = SplitCsv(row.gemCsv) });
		}
		return snapshot;
	}
}
