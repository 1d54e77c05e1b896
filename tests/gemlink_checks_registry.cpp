#include "gemlink_checks_common.h"

#include "GemLink/GemError.h"

#include <algorithm>

namespace GemLinkChecks
{
	bool CheckRegistryRegistration()
	{
		using GemLink::GemErrorCategory;
		using GemLink::GemErrorCode;
		using GemLink::StatKey;

		GemLink::GemTemplateRegistry registry{};

		const auto first = registry.RegisterActive(
			"frost_bolt",
			"Frost Bolt",
			GemLink::GemRequirements{ .intelligence = 10 },
			GemLink::StatBlock{ { StatKey::kDamage, 9.0 } },
			"Fires a shard of ice",
			{ "Spell", "COLD", "spell" });
		if (!first) {
			std::cerr << "registry: expected first registration to succeed\n";
			return false;
		}

		// Duplicate id is rejected and the original stays.
		const auto duplicate = registry.RegisterSupport(
			"frost_bolt",
			"Frost Bolt Support",
			GemLink::GemRequirements{},
			GemLink::StatBlock{},
			"",
			{});
		if (duplicate || duplicate.code != GemErrorCode::kDuplicateTemplateId ||
		    duplicate.Category() != GemErrorCategory::kConfiguration) {
			std::cerr << "registry: expected duplicate id to be rejected\n";
			return false;
		}

		const auto emptyName = registry.RegisterActive("nameless", "", GemLink::GemRequirements{}, GemLink::StatBlock{}, "", {});
		if (emptyName || emptyName.code != GemErrorCode::kInvalidTemplate || registry.Size() != 1) {
			std::cerr << "registry: expected empty name to be rejected\n";
			return false;
		}

		const auto looked = registry.Lookup("frost_bolt");
		if (!looked || looked->kind != GemLink::GemKind::kActive || looked->socketColor != GemLink::SocketColor::kBlue) {
			std::cerr << "registry: expected lookup to return the active blue template\n";
			return false;
		}

		// Tags are lower-cased and deduplicated.
		if (looked->tags != std::vector<std::string>{ "spell", "cold" }) {
			std::cerr << "registry: expected normalized tags [spell, cold]\n";
			return false;
		}

		// Lookup hands out independent copies.
		auto copy = *looked;
		copy.name = "Mutated";
		copy.baseStats.Set(StatKey::kDamage, 999.0);
		const auto again = registry.Lookup("frost_bolt");
		if (!again || again->name != "Frost Bolt" || again->baseStats.GetOr(StatKey::kDamage, 0.0) != 9.0) {
			std::cerr << "registry: expected lookup copies to be independent\n";
			return false;
		}

		if (registry.Lookup("missing") || registry.Instantiate("missing") || registry.Contains("FROST_BOLT")) {
			std::cerr << "registry: expected lookup miss for unknown ids\n";
			return false;
		}

		auto instance = registry.Instantiate("frost_bolt");
		if (!instance || instance->Level() != 1u || instance->Quality() != 0u || instance->Experience() != 0u) {
			std::cerr << "registry: expected fresh instance at level 1\n";
			return false;
		}

		return true;
	}

	bool CheckRegistrySearchAndClasses()
	{
		const auto registry = MakeBuiltInRegistry();
		if (registry.Size() != 17u || registry.AllActive().size() != 7u || registry.AllSupport().size() != 10u) {
			std::cerr << "registry: expected 7 active and 10 support built-in gems\n";
			return false;
		}

		// Empty query matches everything, actives first.
		const auto everything = registry.Search("");
		if (everything.size() != registry.Size() || everything.front().id != "fireball" ||
		    everything.back().kind != GemLink::GemKind::kSupport) {
			std::cerr << "registry: expected empty search to list every gem, actives first\n";
			return false;
		}

		const auto fire = registry.Search("FIRE");
		const auto firstSupport = std::find_if(fire.begin(), fire.end(), [](const GemLink::GemTemplate& a_template) {
			return a_template.kind == GemLink::GemKind::kSupport;
		});
		const bool activesFirst = std::all_of(firstSupport, fire.end(), [](const GemLink::GemTemplate& a_template) {
			return a_template.kind == GemLink::GemKind::kSupport;
		});
		const auto hasId = [&](std::string_view a_id) {
			return std::any_of(fire.begin(), fire.end(), [&](const GemLink::GemTemplate& a_template) {
				return a_template.id == a_id;
			});
		};
		if (!activesFirst || !hasId("fireball") || !hasId("burning_arrow") || !hasId("added_fire_damage") || hasId("ice_nova")) {
			std::cerr << "registry: unexpected case-insensitive search result for 'FIRE'\n";
			return false;
		}

		const auto supportOnly = registry.Search("fire", GemLink::GemTemplateRegistry::KindFilter::kSupport);
		if (supportOnly.size() != 1u || supportOnly.front().id != "added_fire_damage") {
			std::cerr << "registry: expected support-only search to return added_fire_damage\n";
			return false;
		}

		if (!registry.Search("no such gem").empty()) {
			std::cerr << "registry: expected no matches for unknown query\n";
			return false;
		}

		const auto witch = registry.GemsForClass("wItCh");
		if (witch.size() != 5u || witch.front().id != "fireball" || witch.back().id != "added_cold_damage") {
			std::cerr << "registry: unexpected Witch starter gems\n";
			return false;
		}
		if (!registry.GemsForClass("Necromancer").empty()) {
			std::cerr << "registry: expected unknown class to have no starter gems\n";
			return false;
		}

		// Starter lists skip ids that are not registered.
		GemLink::GemTemplateRegistry custom{};
		(void)custom.RegisterActive("bolt", "Bolt", GemLink::GemRequirements{}, GemLink::StatBlock{}, "", {});
		custom.RegisterClassStarterGems("Mage", { "bolt", "ghost_gem" });
		const auto mage = custom.GemsForClass("mage");
		if (mage.size() != 1u || mage.front().id != "bolt") {
			std::cerr << "registry: expected unknown starter ids to be skipped\n";
			return false;
		}

		return true;
	}

	bool CheckRegistrySingleton()
	{
		const auto& first = GemLink::GemTemplateRegistry::GetSingleton();
		const auto& second = GemLink::GemTemplateRegistry::GetSingleton();
		if (&first != &second) {
			std::cerr << "registry: expected one process-wide registry\n";
			return false;
		}

		// Either the shipped catalog file or the compiled fallback; both carry the same gems.
		if (first.Size() != 17u || !first.Contains("spell_echo") || first.GemsForClass("Scion").size() != 4u) {
			std::cerr << "registry: expected singleton to hold the full catalog\n";
			return false;
		}

		return true;
	}
}
