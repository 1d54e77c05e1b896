#pragma once

#include <cmath>
#include <cstdint>
#include <limits>

namespace GemLink
{
	inline constexpr double kExperienceBase = 1000.0;
	inline constexpr double kExperienceGrowthPerLevel = 1.1;
	inline constexpr double kStatGrowthPerLevel = 0.06;
	// Absorbs representation error before ceil/floor (e.g. 100 * 1.2).
	inline constexpr double kRoundingEpsilon = 1e-9;

	[[nodiscard]] inline std::uint64_t ComputeExperienceToNextLevel(std::uint32_t a_level)
	{
		const std::uint32_t level = a_level == 0u ? 1u : a_level;
		const double cost = std::floor(kExperienceBase * std::pow(kExperienceGrowthPerLevel, static_cast<double>(level - 1u)));
		if (!(cost < static_cast<double>(std::numeric_limits<std::uint64_t>::max()))) {
			return std::numeric_limits<std::uint64_t>::max();
		}
		return static_cast<std::uint64_t>(cost);
	}

	[[nodiscard]] constexpr double LevelStatMultiplier(std::uint32_t a_level) noexcept
	{
		return a_level <= 1u ? 1.0 : 1.0 + static_cast<double>(a_level - 1u) * kStatGrowthPerLevel;
	}

	[[nodiscard]] constexpr double QualityMultiplier(std::uint32_t a_quality) noexcept
	{
		return 1.0 + static_cast<double>(a_quality) / 100.0;
	}

	[[nodiscard]] inline double ScaleStatForLevel(double a_value, std::uint32_t a_level)
	{
		return std::ceil(a_value * LevelStatMultiplier(a_level) - kRoundingEpsilon);
	}

	[[nodiscard]] inline double ScaleStatForQuality(double a_value, std::uint32_t a_quality)
	{
		return std::floor(a_value * QualityMultiplier(a_quality) + kRoundingEpsilon);
	}
}
