#include "GemLink/SkillGemInstance.h"

#include "GemLink/GemProgression.h"

#include <limits>
#include <utility>

namespace GemLink
{
	SkillGemInstance::SkillGemInstance(GemTemplate a_template) :
		_template(std::move(a_template)),
		_socketColor(ResolveSocketColor(_template.requirements))
	{
		if (_template.maxLevel == 0u) {
			_template.maxLevel = 1u;
		}
	}

	std::uint64_t SkillGemInstance::ExperienceToNextLevel() const
	{
		return ComputeExperienceToNextLevel(_level);
	}

	bool SkillGemInstance::CanLevelUp() const
	{
		return _level < _template.maxLevel && _experience >= ExperienceToNextLevel();
	}

	OperationResult SkillGemInstance::AddExperience(std::int64_t a_amount)
	{
		if (a_amount < 0) {
			return OperationResult::Fail(GemErrorCode::kNegativeExperience);
		}

		const auto amount = static_cast<std::uint64_t>(a_amount);
		const auto headroom = std::numeric_limits<std::uint64_t>::max() - _experience;
		_experience += (amount > headroom) ? headroom : amount;

		while (CanLevelUp()) {
			_experience -= ExperienceToNextLevel();
			++_level;
		}

		return OperationResult::Ok();
	}

	OperationResult SkillGemInstance::SetQuality(std::int32_t a_quality)
	{
		if (a_quality < 0 || static_cast<std::uint32_t>(a_quality) > _template.maxQuality) {
			return OperationResult::Fail(GemErrorCode::kQualityOutOfRange);
		}

		_quality = static_cast<std::uint32_t>(a_quality);
		return OperationResult::Ok();
	}

	OperationResult SkillGemInstance::RestoreProgress(
		std::uint32_t a_level,
		std::uint64_t a_experience,
		std::uint32_t a_quality)
	{
		if (a_level < 1u || a_level > _template.maxLevel) {
			return OperationResult::Fail(GemErrorCode::kLevelOutOfRange);
		}
		if (a_quality > _template.maxQuality) {
			return OperationResult::Fail(GemErrorCode::kQualityOutOfRange);
		}

		_level = a_level;
		_experience = a_experience;
		_quality = a_quality;
		return OperationResult::Ok();
	}

	StatBlock SkillGemInstance::CurrentStats() const
	{
		StatBlock stats = _template.baseStats;

		if (_level > 1u) {
			_template.baseStats.ForEach([&](StatKey a_key, double a_value) {
				if (IsLevelScaledStat(a_key)) {
					stats.Set(a_key, ScaleStatForLevel(a_value, _level));
				}
			});
		}

		if (_quality > 0u) {
			const StatBlock leveled = stats;
			leveled.ForEach([&](StatKey a_key, double a_value) {
				if (IsQualityScaledStat(a_key)) {
					stats.Set(a_key, ScaleStatForQuality(a_value, _quality));
				}
			});
		}

		return stats;
	}

	bool SkillGemInstance::MeetsRequirements(const CharacterSnapshot& a_character) const noexcept
	{
		const auto& req = _template.requirements;
		return a_character.level >= req.level &&
		       a_character.strength >= req.strength &&
		       a_character.dexterity >= req.dexterity &&
		       a_character.intelligence >= req.intelligence;
	}
}
