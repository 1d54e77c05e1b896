#pragma once

#include <string_view>

namespace GemLink::GemStateContract
{
	inline constexpr std::string_view kFieldSockets = "sockets";
	inline constexpr std::string_view kFieldLinks = "links";
	inline constexpr std::string_view kFieldSocketColor = "color";
	inline constexpr std::string_view kFieldSocketGem = "gem";

	inline constexpr std::string_view kFieldGemTemplateId = "templateId";
	inline constexpr std::string_view kFieldGemLevel = "level";
	inline constexpr std::string_view kFieldGemExperience = "experience";
	inline constexpr std::string_view kFieldGemQuality = "quality";

	inline constexpr std::string_view kFieldCharacterLevel = "level";
	inline constexpr std::string_view kFieldCharacterStrength = "strength";
	inline constexpr std::string_view kFieldCharacterDexterity = "dexterity";
	inline constexpr std::string_view kFieldCharacterIntelligence = "intelligence";
	inline constexpr std::string_view kFieldCharacterResourceCurrent = "resourceCurrent";
	inline constexpr std::string_view kFieldCharacterResourceMax = "resourceMax";
	inline constexpr std::string_view kFieldCharacterModifiers = "modifiers";

	inline constexpr std::string_view kFieldModifierTag = "tag";
	inline constexpr std::string_view kFieldModifierStat = "stat";
	inline constexpr std::string_view kFieldModifierPercent = "percent";
}
