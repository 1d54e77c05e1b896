#pragma once

#include "GemLink/SocketColor.h"
#include "GemLink/StatBlock.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace GemLink
{
	inline constexpr std::uint32_t kDefaultMaxGemLevel = 20;
	inline constexpr std::uint32_t kDefaultMaxGemQuality = 100;

	enum class GemKind : std::uint8_t
	{
		kActive = 0,
		kSupport,
	};

	[[nodiscard]] constexpr std::string_view DescribeGemKind(GemKind a_kind) noexcept
	{
		return a_kind == GemKind::kActive ? "active" : "support";
	}

	struct GemTemplate
	{
		std::string id{};
		std::string name{};
		GemKind kind{ GemKind::kActive };
		GemRequirements requirements{};
		StatBlock baseStats{};
		std::string description{};
		std::vector<std::string> tags{};
		SocketColor socketColor{ SocketColor::kRed };
		std::uint32_t maxLevel{ kDefaultMaxGemLevel };
		std::uint32_t maxQuality{ kDefaultMaxGemQuality };

		[[nodiscard]] bool HasTag(std::string_view a_tag) const
		{
			return std::find(tags.begin(), tags.end(), a_tag) != tags.end();
		}
	};
}
