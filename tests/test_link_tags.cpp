#include "GemLink/LinkResolver.h"

#include <array>
#include <string_view>

namespace
{
	constexpr std::array<std::string_view, 4> kFireballTags{ "spell", "projectile", "fire", "aoe" };
	constexpr std::array<std::string_view, 3> kIceNovaTags{ "spell", "aoe", "cold" };
	constexpr std::array<std::string_view, 1> kFireSupport{ "fire" };
	constexpr std::array<std::string_view, 0> kUntagged{};
}

static_assert(GemLink::AreTagsCompatible(kFireSupport, kFireballTags));
static_assert(!GemLink::AreTagsCompatible(kFireSupport, kIceNovaTags));

// Untagged supports attach to anything, including untagged actives.
static_assert(GemLink::AreTagsCompatible(kUntagged, kIceNovaTags));
static_assert(GemLink::AreTagsCompatible(kUntagged, kUntagged));
static_assert(!GemLink::AreTagsCompatible(kFireSupport, kUntagged));
