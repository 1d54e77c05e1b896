#include "GemLink/TextMatch.h"

#include <array>
#include <string_view>

static_assert(GemLink::detail::ToLowerAscii('F') == 'f');
static_assert(GemLink::detail::ToLowerAscii('_') == '_');

static_assert(GemLink::detail::EqualsCaseInsensitiveAscii("Witch", "wITCH"));
static_assert(!GemLink::detail::EqualsCaseInsensitiveAscii("Witch", "Witches"));

static_assert(GemLink::detail::ContainsCaseInsensitiveAscii("Added Fire Damage Support", "FIRE"));
static_assert(GemLink::detail::ContainsCaseInsensitiveAscii("fireball", "ball"));
static_assert(!GemLink::detail::ContainsCaseInsensitiveAscii("fireball", "cold"));
static_assert(!GemLink::detail::ContainsCaseInsensitiveAscii("fireball", ""));
static_assert(!GemLink::detail::ContainsCaseInsensitiveAscii("ice", "ice nova"));

static_assert([] {
	constexpr std::array<std::string_view, 3> tags{ "spell", "aoe", "cold" };
	return GemLink::detail::AnyContainsCaseInsensitiveAscii(tags, "COLD") &&
	       !GemLink::detail::AnyContainsCaseInsensitiveAscii(tags, "fire");
}());

static_assert([] {
	constexpr std::array<std::string_view, 0> tags{};
	return !GemLink::detail::AnyContainsCaseInsensitiveAscii(tags, "spell");
}());
