#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace GemLink
{
	enum class SocketColor : std::uint8_t
	{
		kRed = 0,
		kGreen,
		kBlue,
		kWhite,
	};

	struct GemRequirements
	{
		std::uint32_t level{ 1 };
		std::uint32_t strength{ 0 };
		std::uint32_t dexterity{ 0 };
		std::uint32_t intelligence{ 0 };

		[[nodiscard]] constexpr bool operator==(const GemRequirements& a_rhs) const noexcept = default;
	};

	// Ties resolve strength > dexterity > intelligence. Gems never resolve to white.
	[[nodiscard]] constexpr SocketColor ResolveSocketColor(const GemRequirements& a_requirements) noexcept
	{
		if (a_requirements.strength >= a_requirements.dexterity &&
			a_requirements.strength >= a_requirements.intelligence) {
			return SocketColor::kRed;
		}
		if (a_requirements.dexterity >= a_requirements.intelligence) {
			return SocketColor::kGreen;
		}
		return SocketColor::kBlue;
	}

	[[nodiscard]] constexpr bool IsSocketColorCompatible(SocketColor a_socket, SocketColor a_gem) noexcept
	{
		return a_socket == SocketColor::kWhite || a_socket == a_gem;
	}

	[[nodiscard]] constexpr std::string_view DescribeSocketColor(SocketColor a_color) noexcept
	{
		switch (a_color) {
		case SocketColor::kRed:
			return "red";
		case SocketColor::kGreen:
			return "green";
		case SocketColor::kBlue:
			return "blue";
		case SocketColor::kWhite:
			return "white";
		}
		return "unknown";
	}

	[[nodiscard]] constexpr std::optional<SocketColor> ParseSocketColor(std::string_view a_text) noexcept
	{
		if (a_text == "red") {
			return SocketColor::kRed;
		}
		if (a_text == "green") {
			return SocketColor::kGreen;
		}
		if (a_text == "blue") {
			return SocketColor::kBlue;
		}
		if (a_text == "white") {
			return SocketColor::kWhite;
		}
		return std::nullopt;
	}
}
