#pragma once

#include "GemLink/CharacterSnapshot.h"
#include "GemLink/GemError.h"
#include "GemLink/LinkResolver.h"

namespace GemLink
{
	// Cost is composed without character-side modifiers; resources are never deducted here.
	[[nodiscard]] double ComputeEligibilityCost(const SkillSetup& a_setup);

	[[nodiscard]] OperationResult EvaluateSkillUse(const SkillSetup& a_setup, const CharacterSnapshot& a_character);

	[[nodiscard]] bool CanUseSkill(const SkillSetup& a_setup, const CharacterSnapshot& a_character);
}
