#include "GemLink/SkillEligibility.h"

#include "GemLink/StatCompositor.h"

#include <span>

namespace GemLink
{
	double ComputeEligibilityCost(const SkillSetup& a_setup)
	{
		const auto stats = CalculateSkillDamage(a_setup, std::span<const CharacterModifier>{});
		return stats.GetOr(StatKey::kManaCost, 0.0);
	}

	OperationResult EvaluateSkillUse(const SkillSetup& a_setup, const CharacterSnapshot& a_character)
	{
		if (!a_setup.activeGem) {
			return OperationResult::Fail(GemErrorCode::kMissingActiveGem);
		}
		if (a_character.resourceCurrent < ComputeEligibilityCost(a_setup)) {
			return OperationResult::Fail(GemErrorCode::kInsufficientResource);
		}
		if (!a_setup.activeGem->MeetsRequirements(a_character)) {
			return OperationResult::Fail(GemErrorCode::kRequirementsUnmet);
		}
		return OperationResult::Ok();
	}

	bool CanUseSkill(const SkillSetup& a_setup, const CharacterSnapshot& a_character)
	{
		return EvaluateSkillUse(a_setup, a_character).success;
	}
}
