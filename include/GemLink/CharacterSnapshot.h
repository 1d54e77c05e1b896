#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GemLink
{
	enum class ModifierStat : std::uint8_t
	{
		kDamageIncreased = 0,
		kCastSpeedIncreased,
		kAttackSpeedIncreased,
		kManaCostIncreased,
	};

	[[nodiscard]] constexpr std::string_view DescribeModifierStat(ModifierStat a_stat) noexcept
	{
		switch (a_stat) {
		case ModifierStat::kDamageIncreased:
			return "damageIncreased";
		case ModifierStat::kCastSpeedIncreased:
			return "castSpeedIncreased";
		case ModifierStat::kAttackSpeedIncreased:
			return "attackSpeedIncreased";
		case ModifierStat::kManaCostIncreased:
			return "manaCostIncreased";
		}
		return "unknown";
	}

	[[nodiscard]] constexpr std::optional<ModifierStat> ParseModifierStat(std::string_view a_text) noexcept
	{
		if (a_text == "damageIncreased") {
			return ModifierStat::kDamageIncreased;
		}
		if (a_text == "castSpeedIncreased") {
			return ModifierStat::kCastSpeedIncreased;
		}
		if (a_text == "attackSpeedIncreased") {
			return ModifierStat::kAttackSpeedIncreased;
		}
		if (a_text == "manaCostIncreased") {
			return ModifierStat::kManaCostIncreased;
		}
		return std::nullopt;
	}

	// "spell damage +50%" is { .tag = "spell", .stat = kDamageIncreased, .percent = 50 }.
	// An empty tag applies to every skill.
	struct CharacterModifier
	{
		std::string tag{};
		ModifierStat stat{ ModifierStat::kDamageIncreased };
		double percent{ 0.0 };
	};

	struct CharacterSnapshot
	{
		std::uint32_t level{ 1 };
		std::uint32_t strength{ 0 };
		std::uint32_t dexterity{ 0 };
		std::uint32_t intelligence{ 0 };
		std::vector<CharacterModifier> modifiers{};
		double resourceCurrent{ 0.0 };
		double resourceMax{ 0.0 };
	};
}
