#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace GemLink::detail
{
	[[nodiscard]] constexpr char ToLowerAscii(char a_char) noexcept
	{
		return (a_char >= 'A' && a_char <= 'Z') ? static_cast<char>(a_char + ('a' - 'A')) : a_char;
	}

	[[nodiscard]] inline std::string ToLowerAscii(std::string_view a_text)
	{
		std::string out(a_text);
		for (auto& c : out) {
			c = ToLowerAscii(c);
		}
		return out;
	}

	[[nodiscard]] constexpr bool EqualsCaseInsensitiveAscii(std::string_view a_lhs, std::string_view a_rhs) noexcept
	{
		if (a_lhs.size() != a_rhs.size()) {
			return false;
		}
		for (std::size_t i = 0; i < a_lhs.size(); ++i) {
			if (ToLowerAscii(a_lhs[i]) != ToLowerAscii(a_rhs[i])) {
				return false;
			}
		}
		return true;
	}

	// Empty pattern never matches; callers decide what an empty query means.
	[[nodiscard]] constexpr bool ContainsCaseInsensitiveAscii(std::string_view a_text, std::string_view a_pattern) noexcept
	{
		if (a_pattern.empty() || a_text.size() < a_pattern.size()) {
			return false;
		}

		for (std::size_t i = 0; i + a_pattern.size() <= a_text.size(); ++i) {
			bool matched = true;
			for (std::size_t j = 0; j < a_pattern.size(); ++j) {
				if (ToLowerAscii(a_text[i + j]) != ToLowerAscii(a_pattern[j])) {
					matched = false;
					break;
				}
			}
			if (matched) {
				return true;
			}
		}

		return false;
	}

	template <class TextRange>
	[[nodiscard]] constexpr bool AnyContainsCaseInsensitiveAscii(const TextRange& a_texts, std::string_view a_pattern) noexcept
	{
		for (const auto& rawText : a_texts) {
			const std::string_view text{ rawText };
			if (ContainsCaseInsensitiveAscii(text, a_pattern)) {
				return true;
			}
		}
		return false;
	}
}
