#pragma once

#include "GemLink/CharacterSnapshot.h"
#include "GemLink/LinkResolver.h"
#include "GemLink/StatBlock.h"

#include <span>
#include <string>
#include <vector>

namespace GemLink
{
	inline constexpr double kMinSpeedFactor = 0.01;

	// Folds one support's current stats into a_running. Added damage percentages are taken
	// from a_originalBaseDamage, never from the running value.
	void ApplySupportModifiers(StatBlock& a_running, const StatBlock& a_supportStats, double a_originalBaseDamage);

	// Same-stat modifiers matching the skill's tags are summed, then applied once.
	void ApplyCharacterModifiers(
		StatBlock& a_running,
		const std::vector<std::string>& a_skillTags,
		std::span<const CharacterModifier> a_modifiers);

	// Returns a fresh block. An empty setup yields an empty block.
	[[nodiscard]] StatBlock CalculateSkillDamage(
		const SkillSetup& a_setup,
		std::span<const CharacterModifier> a_modifiers);

	[[nodiscard]] StatBlock CalculateSkillDamage(
		const SkillSetup& a_setup,
		const CharacterSnapshot& a_character);
}
