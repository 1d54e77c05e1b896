#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace GemLink
{
	// Declaration order is also fold order within a single support gem.
	enum class StatKey : std::uint8_t
	{
		// Base skill stats.
		kDamage = 0,
		kAddedFireDamage,
		kAddedColdDamage,
		kAddedLightningDamage,
		kBurnDamage,
		kCastTime,
		kAttackTime,
		kBurnDuration,
		kManaCost,
		kCriticalChance,
		kCriticalMultiplier,
		kChainCount,
		kAttackCount,
		kProjectileSpeed,
		kRadius,

		// Support modifiers.
		kDamageMultiplier,
		kPhysicalDamageMultiplier,
		kCastSpeedMultiplier,
		kAttackSpeedMultiplier,
		kManaCostMultiplier,
		kAddedFireDamagePercent,
		kAddedColdDamagePercent,
		kAddedLightningDamagePercent,
		kCriticalChanceMultiplier,
		kCriticalMultiplierMultiplier,
		kPierceChance,
		kPierceCount,
		kProjectileCount,
		kAttackRepeatCount,
		kSpellRepeatCount,
		kFreezeChance,

		kTotal
	};

	inline constexpr std::size_t kStatKeyCount = static_cast<std::size_t>(StatKey::kTotal);

	enum class StatCategory : std::uint8_t
	{
		kDamage = 0,
		kTiming,
		kResource,
		kCritical,
		kMechanicCount,
		kArea,
	};

	enum class MergeRule : std::uint8_t
	{
		kNone = 0,          // carried on the skill, ignored when it appears on a support
		kMultiplyTarget,    // target = (target or default) * value
		kDivideTarget,      // target = (target or default) / value
		kAddPercentOfBase,  // target label += base damage * value / 100, damage += same
		kOverwrite,         // target = value, last applied wins
	};

	struct StatDescriptor
	{
		StatKey key{ StatKey::kDamage };
		std::string_view name{};
		StatCategory category{ StatCategory::kDamage };
		MergeRule rule{ MergeRule::kNone };
		StatKey target{ StatKey::kDamage };
		double targetDefault{ 0.0 };
	};

	inline constexpr std::array<StatDescriptor, kStatKeyCount> kStatDescriptors{ {
		{ StatKey::kDamage, "damage", StatCategory::kDamage, MergeRule::kNone, StatKey::kDamage, 0.0 },
		{ StatKey::kAddedFireDamage, "addedFireDamage", StatCategory::kDamage, MergeRule::kNone, StatKey::kAddedFireDamage, 0.0 },
		{ StatKey::kAddedColdDamage, "addedColdDamage", StatCategory::kDamage, MergeRule::kNone, StatKey::kAddedColdDamage, 0.0 },
		{ StatKey::kAddedLightningDamage, "addedLightningDamage", StatCategory::kDamage, MergeRule::kNone, StatKey::kAddedLightningDamage, 0.0 },
		{ StatKey::kBurnDamage, "burnDamage", StatCategory::kDamage, MergeRule::kNone, StatKey::kBurnDamage, 0.0 },
		{ StatKey::kCastTime, "castTime", StatCategory::kTiming, MergeRule::kNone, StatKey::kCastTime, 0.0 },
		{ StatKey::kAttackTime, "attackTime", StatCategory::kTiming, MergeRule::kNone, StatKey::kAttackTime, 0.0 },
		{ StatKey::kBurnDuration, "burnDuration", StatCategory::kTiming, MergeRule::kNone, StatKey::kBurnDuration, 0.0 },
		{ StatKey::kManaCost, "manaCost", StatCategory::kResource, MergeRule::kNone, StatKey::kManaCost, 0.0 },
		{ StatKey::kCriticalChance, "criticalChance", StatCategory::kCritical, MergeRule::kNone, StatKey::kCriticalChance, 0.0 },
		{ StatKey::kCriticalMultiplier, "criticalMultiplier", StatCategory::kCritical, MergeRule::kNone, StatKey::kCriticalMultiplier, 0.0 },
		{ StatKey::kChainCount, "chainCount", StatCategory::kMechanicCount, MergeRule::kNone, StatKey::kChainCount, 0.0 },
		{ StatKey::kAttackCount, "attackCount", StatCategory::kMechanicCount, MergeRule::kNone, StatKey::kAttackCount, 0.0 },
		{ StatKey::kProjectileSpeed, "projectileSpeed", StatCategory::kArea, MergeRule::kNone, StatKey::kProjectileSpeed, 0.0 },
		{ StatKey::kRadius, "radius", StatCategory::kArea, MergeRule::kNone, StatKey::kRadius, 0.0 },

		{ StatKey::kDamageMultiplier, "damageMultiplier", StatCategory::kDamage, MergeRule::kMultiplyTarget, StatKey::kDamage, 1.0 },
		{ StatKey::kPhysicalDamageMultiplier, "physicalDamageMultiplier", StatCategory::kDamage, MergeRule::kMultiplyTarget, StatKey::kDamage, 1.0 },
		{ StatKey::kCastSpeedMultiplier, "castSpeedMultiplier", StatCategory::kTiming, MergeRule::kDivideTarget, StatKey::kCastTime, 1.0 },
		{ StatKey::kAttackSpeedMultiplier, "attackSpeedMultiplier", StatCategory::kTiming, MergeRule::kDivideTarget, StatKey::kAttackTime, 1.0 },
		{ StatKey::kManaCostMultiplier, "manaCostMultiplier", StatCategory::kResource, MergeRule::kMultiplyTarget, StatKey::kManaCost, 0.0 },
		{ StatKey::kAddedFireDamagePercent, "addedFireDamagePercent", StatCategory::kDamage, MergeRule::kAddPercentOfBase, StatKey::kAddedFireDamage, 0.0 },
		{ StatKey::kAddedColdDamagePercent, "addedColdDamagePercent", StatCategory::kDamage, MergeRule::kAddPercentOfBase, StatKey::kAddedColdDamage, 0.0 },
		{ StatKey::kAddedLightningDamagePercent, "addedLightningDamagePercent", StatCategory::kDamage, MergeRule::kAddPercentOfBase, StatKey::kAddedLightningDamage, 0.0 },
		{ StatKey::kCriticalChanceMultiplier, "criticalChanceMultiplier", StatCategory::kCritical, MergeRule::kMultiplyTarget, StatKey::kCriticalChance, 0.05 },
		{ StatKey::kCriticalMultiplierMultiplier, "criticalMultiplierMultiplier", StatCategory::kCritical, MergeRule::kMultiplyTarget, StatKey::kCriticalMultiplier, 1.5 },
		{ StatKey::kPierceChance, "pierceChance", StatCategory::kMechanicCount, MergeRule::kOverwrite, StatKey::kPierceChance, 0.0 },
		{ StatKey::kPierceCount, "pierceCount", StatCategory::kMechanicCount, MergeRule::kOverwrite, StatKey::kPierceCount, 0.0 },
		{ StatKey::kProjectileCount, "projectileCount", StatCategory::kMechanicCount, MergeRule::kOverwrite, StatKey::kProjectileCount, 0.0 },
		{ StatKey::kAttackRepeatCount, "attackRepeatCount", StatCategory::kMechanicCount, MergeRule::kOverwrite, StatKey::kAttackRepeatCount, 0.0 },
		{ StatKey::kSpellRepeatCount, "spellRepeatCount", StatCategory::kMechanicCount, MergeRule::kOverwrite, StatKey::kSpellRepeatCount, 0.0 },
		{ StatKey::kFreezeChance, "freezeChance", StatCategory::kMechanicCount, MergeRule::kOverwrite, StatKey::kFreezeChance, 0.0 },
	} };

	[[nodiscard]] constexpr std::size_t StatIndex(StatKey a_key) noexcept
	{
		return static_cast<std::size_t>(a_key);
	}

	[[nodiscard]] constexpr const StatDescriptor& GetStatDescriptor(StatKey a_key) noexcept
	{
		return kStatDescriptors[StatIndex(a_key)];
	}

	[[nodiscard]] constexpr std::string_view StatName(StatKey a_key) noexcept
	{
		return GetStatDescriptor(a_key).name;
	}

	[[nodiscard]] constexpr std::optional<StatKey> FindStatKey(std::string_view a_name) noexcept
	{
		for (const auto& descriptor : kStatDescriptors) {
			if (descriptor.name == a_name) {
				return descriptor.key;
			}
		}
		return std::nullopt;
	}

	// Timing keys named "...Time" keep their base value across gem levels.
	[[nodiscard]] constexpr bool IsLevelScaledStat(StatKey a_key) noexcept
	{
		return StatName(a_key).find("Time") == std::string_view::npos;
	}

	// Quality only touches keys whose wire name contains lower-case "damage".
	[[nodiscard]] constexpr bool IsQualityScaledStat(StatKey a_key) noexcept
	{
		return StatName(a_key).find("damage") != std::string_view::npos;
	}

	[[nodiscard]] constexpr bool IsStatDescriptorTableConsistent() noexcept
	{
		for (std::size_t i = 0; i < kStatDescriptors.size(); ++i) {
			if (StatIndex(kStatDescriptors[i].key) != i || kStatDescriptors[i].name.empty()) {
				return false;
			}
		}
		return true;
	}

	static_assert(IsStatDescriptorTableConsistent(), "kStatDescriptors must be indexed by StatKey");
}
