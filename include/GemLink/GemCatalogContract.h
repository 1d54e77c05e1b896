#pragma once

#include <string_view>

namespace GemLink::GemCatalogContract
{
	inline constexpr std::string_view kGemCatalogRelativePath = "data/gem_catalog.json";

	inline constexpr std::string_view kFieldActiveGems = "activeGems";
	inline constexpr std::string_view kFieldSupportGems = "supportGems";
	inline constexpr std::string_view kFieldClassStarterGems = "classStarterGems";

	inline constexpr std::string_view kFieldGemId = "id";
	inline constexpr std::string_view kFieldGemName = "name";
	inline constexpr std::string_view kFieldGemRequirements = "requirements";
	inline constexpr std::string_view kFieldGemStats = "stats";
	inline constexpr std::string_view kFieldGemDescription = "description";
	inline constexpr std::string_view kFieldGemTags = "tags";
	inline constexpr std::string_view kFieldGemMaxLevel = "maxLevel";
	inline constexpr std::string_view kFieldGemMaxQuality = "maxQuality";

	inline constexpr std::string_view kFieldRequirementLevel = "level";
	inline constexpr std::string_view kFieldRequirementStrength = "strength";
	inline constexpr std::string_view kFieldRequirementDexterity = "dexterity";
	inline constexpr std::string_view kFieldRequirementIntelligence = "intelligence";

	inline constexpr std::string_view kFieldStarterClass = "class";
	inline constexpr std::string_view kFieldStarterGems = "gems";
}
