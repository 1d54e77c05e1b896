#pragma once

#include "GemLink/CharacterSnapshot.h"
#include "GemLink/GemError.h"
#include "GemLink/GemTemplate.h"
#include "GemLink/StatBlock.h"

#include <cstdint>
#include <string>
#include <vector>

namespace GemLink
{
	// Per-character gem. Owns a value copy of its template, so no state is shared between characters.
	class SkillGemInstance
	{
	public:
		explicit SkillGemInstance(GemTemplate a_template);

		[[nodiscard]] const GemTemplate& Template() const noexcept { return _template; }
		[[nodiscard]] const std::string& TemplateId() const noexcept { return _template.id; }
		[[nodiscard]] const std::string& Name() const noexcept { return _template.name; }
		[[nodiscard]] GemKind Kind() const noexcept { return _template.kind; }
		[[nodiscard]] bool IsActive() const noexcept { return _template.kind == GemKind::kActive; }
		[[nodiscard]] bool IsSupport() const noexcept { return _template.kind == GemKind::kSupport; }
		[[nodiscard]] const std::vector<std::string>& Tags() const noexcept { return _template.tags; }
		[[nodiscard]] SocketColor GetSocketColor() const noexcept { return _socketColor; }

		[[nodiscard]] std::uint32_t Level() const noexcept { return _level; }
		[[nodiscard]] std::uint32_t MaxLevel() const noexcept { return _template.maxLevel; }
		[[nodiscard]] std::uint64_t Experience() const noexcept { return _experience; }
		[[nodiscard]] std::uint32_t Quality() const noexcept { return _quality; }

		[[nodiscard]] std::uint64_t ExperienceToNextLevel() const;
		[[nodiscard]] bool CanLevelUp() const;

		// Awards experience and applies every level-up it pays for.
		OperationResult AddExperience(std::int64_t a_amount);
		OperationResult SetQuality(std::int32_t a_quality);
		OperationResult RestoreProgress(std::uint32_t a_level, std::uint64_t a_experience, std::uint32_t a_quality);

		[[nodiscard]] StatBlock CurrentStats() const;
		[[nodiscard]] bool MeetsRequirements(const CharacterSnapshot& a_character) const noexcept;

	private:
		GemTemplate _template;
		SocketColor _socketColor{ SocketColor::kRed };
		std::uint32_t _level{ 1 };
		std::uint64_t _experience{ 0 };
		std::uint32_t _quality{ 0 };
	};
}
