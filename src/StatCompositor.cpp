#include "GemLink/StatCompositor.h"

#include "GemLink/TextMatch.h"

#include <algorithm>
#include <array>

namespace GemLink
{
	namespace
	{
		constexpr std::size_t kModifierStatCount = 4;

		[[nodiscard]] bool ModifierApplies(const CharacterModifier& a_modifier, const std::vector<std::string>& a_skillTags)
		{
			if (a_modifier.tag.empty()) {
				return true;
			}
			return std::any_of(a_skillTags.begin(), a_skillTags.end(), [&](const std::string& a_tag) {
				return detail::EqualsCaseInsensitiveAscii(a_tag, a_modifier.tag);
			});
		}

		void DivideTiming(StatBlock& a_running, StatKey a_timing, double a_increasedPct)
		{
			const double factor = std::max(1.0 + a_increasedPct / 100.0, kMinSpeedFactor);
			a_running.Set(a_timing, a_running.GetOr(a_timing, 1.0) / factor);
		}
	}

	void ApplySupportModifiers(StatBlock& a_running, const StatBlock& a_supportStats, double a_originalBaseDamage)
	{
		a_supportStats.ForEach([&](StatKey a_key, double a_value) {
			const auto& descriptor = GetStatDescriptor(a_key);
			switch (descriptor.rule) {
			case MergeRule::kNone:
				break;
			case MergeRule::kMultiplyTarget:
				a_running.Set(descriptor.target, a_running.GetOr(descriptor.target, descriptor.targetDefault) * a_value);
				break;
			case MergeRule::kDivideTarget:
				if (a_value > 0.0) {
					a_running.Set(descriptor.target, a_running.GetOr(descriptor.target, descriptor.targetDefault) / a_value);
				}
				break;
			case MergeRule::kAddPercentOfBase:
				{
					const double added = a_originalBaseDamage * (a_value / 100.0);
					a_running.Set(descriptor.target, a_running.GetOr(descriptor.target, 0.0) + added);
					a_running.Set(StatKey::kDamage, a_running.GetOr(StatKey::kDamage, 0.0) + added);
				}
				break;
			case MergeRule::kOverwrite:
				a_running.Set(descriptor.target, a_value);
				break;
			}
		});

		if (a_supportStats.Has(StatKey::kPierceChance) && !a_supportStats.Has(StatKey::kPierceCount)) {
			a_running.Set(StatKey::kPierceCount, 1.0);
		}
	}

	void ApplyCharacterModifiers(
		StatBlock& a_running,
		const std::vector<std::string>& a_skillTags,
		std::span<const CharacterModifier> a_modifiers)
	{
		std::array<double, kModifierStatCount> increasedPct{};

		for (const auto& modifier : a_modifiers) {
			if (!ModifierApplies(modifier, a_skillTags)) {
				continue;
			}
			const auto idx = static_cast<std::size_t>(modifier.stat);
			if (idx >= kModifierStatCount) {
				continue;
			}
			increasedPct[idx] += modifier.percent;
		}

		const auto damageIdx = static_cast<std::size_t>(ModifierStat::kDamageIncreased);
		if (increasedPct[damageIdx] != 0.0) {
			a_running.Set(StatKey::kDamage, a_running.GetOr(StatKey::kDamage, 1.0) * (1.0 + increasedPct[damageIdx] / 100.0));
		}

		const auto castIdx = static_cast<std::size_t>(ModifierStat::kCastSpeedIncreased);
		if (increasedPct[castIdx] != 0.0) {
			DivideTiming(a_running, StatKey::kCastTime, increasedPct[castIdx]);
		}

		const auto attackIdx = static_cast<std::size_t>(ModifierStat::kAttackSpeedIncreased);
		if (increasedPct[attackIdx] != 0.0) {
			DivideTiming(a_running, StatKey::kAttackTime, increasedPct[attackIdx]);
		}

		const auto costIdx = static_cast<std::size_t>(ModifierStat::kManaCostIncreased);
		if (increasedPct[costIdx] != 0.0 && a_running.Has(StatKey::kManaCost)) {
			const double factor = std::max(1.0 + increasedPct[costIdx] / 100.0, 0.0);
			a_running.Set(StatKey::kManaCost, a_running.GetOr(StatKey::kManaCost, 0.0) * factor);
		}
	}

	StatBlock CalculateSkillDamage(
		const SkillSetup& a_setup,
		std::span<const CharacterModifier> a_modifiers)
	{
		if (!a_setup.activeGem) {
			return {};
		}

		StatBlock stats = a_setup.activeGem->CurrentStats();
		const double originalBaseDamage = stats.GetOr(StatKey::kDamage, 0.0);

		for (const auto* support : a_setup.supportGems) {
			if (!support) {
				continue;
			}
			ApplySupportModifiers(stats, support->CurrentStats(), originalBaseDamage);
		}

		ApplyCharacterModifiers(stats, a_setup.activeGem->Tags(), a_modifiers);
		return stats;
	}

	StatBlock CalculateSkillDamage(
		const SkillSetup& a_setup,
		const CharacterSnapshot& a_character)
	{
		return CalculateSkillDamage(a_setup, std::span<const CharacterModifier>(a_character.modifiers));
	}
}
