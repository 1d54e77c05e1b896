#include "GemLink/SocketColor.h"

using GemLink::GemRequirements;
using GemLink::ResolveSocketColor;
using GemLink::SocketColor;

static_assert(ResolveSocketColor(GemRequirements{ .strength = 14 }) == SocketColor::kRed);
static_assert(ResolveSocketColor(GemRequirements{ .dexterity = 12 }) == SocketColor::kGreen);
static_assert(ResolveSocketColor(GemRequirements{ .intelligence = 12 }) == SocketColor::kBlue);

// Ties: strength wins over dexterity and intelligence, dexterity wins over intelligence.
static_assert(ResolveSocketColor(GemRequirements{ .strength = 8, .dexterity = 8 }) == SocketColor::kRed);
static_assert(ResolveSocketColor(GemRequirements{ .strength = 8, .intelligence = 8 }) == SocketColor::kRed);
static_assert(ResolveSocketColor(GemRequirements{ .dexterity = 9, .intelligence = 9 }) == SocketColor::kGreen);
static_assert(ResolveSocketColor(GemRequirements{}) == SocketColor::kRed);

static_assert(GemLink::IsSocketColorCompatible(SocketColor::kWhite, SocketColor::kBlue));
static_assert(GemLink::IsSocketColorCompatible(SocketColor::kRed, SocketColor::kRed));
static_assert(!GemLink::IsSocketColorCompatible(SocketColor::kRed, SocketColor::kGreen));

static_assert([] {
	for (const auto color : { SocketColor::kRed, SocketColor::kGreen, SocketColor::kBlue, SocketColor::kWhite }) {
		const auto parsed = GemLink::ParseSocketColor(GemLink::DescribeSocketColor(color));
		if (!parsed || *parsed != color) {
			return false;
		}
	}
	return !GemLink::ParseSocketColor("Red").has_value();
}());
