#pragma once

#include "GemLink/CharacterSnapshot.h"
#include "GemLink/GemError.h"
#include "GemLink/GemTemplateRegistry.h"
#include "GemLink/SkillGemInstance.h"
#include "GemLink/SocketColor.h"
#include "GemLink/SocketGroup.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace GemLink
{
	struct GemInstanceRecord
	{
		std::string templateId{};
		std::uint32_t level{ 1 };
		std::uint64_t experience{ 0 };
		std::uint32_t quality{ 0 };

		[[nodiscard]] bool operator==(const GemInstanceRecord& a_rhs) const = default;
	};

	struct SocketRecord
	{
		SocketColor color{ SocketColor::kWhite };
		std::optional<GemInstanceRecord> gem{};

		[[nodiscard]] bool operator==(const SocketRecord& a_rhs) const = default;
	};

	// Links keep insertion order so a restored group resolves setups identically.
	struct SocketGroupRecord
	{
		std::vector<SocketRecord> sockets{};
		std::vector<SocketLink> links{};

		[[nodiscard]] bool operator==(const SocketGroupRecord& a_rhs) const = default;
	};

	[[nodiscard]] GemInstanceRecord CaptureGemInstance(const SkillGemInstance& a_gem);
	[[nodiscard]] SocketGroupRecord CaptureSocketGroup(const SocketGroup& a_group);

	OperationResult RestoreGemInstance(
		const GemTemplateRegistry& a_registry,
		const GemInstanceRecord& a_record,
		std::optional<SkillGemInstance>& a_outGem);

	// a_outGroup is replaced only when every socket, gem and link restores cleanly.
	OperationResult RestoreSocketGroup(
		const GemTemplateRegistry& a_registry,
		const SocketGroupRecord& a_record,
		SocketGroup& a_outGroup);

	[[nodiscard]] nlohmann::json ToJson(const GemInstanceRecord& a_record);
	[[nodiscard]] nlohmann::json ToJson(const SocketGroupRecord& a_record);
	[[nodiscard]] nlohmann::json ToJson(const CharacterSnapshot& a_character);

	[[nodiscard]] bool FromJson(const nlohmann::json& a_json, GemInstanceRecord& a_outRecord);
	[[nodiscard]] bool FromJson(const nlohmann::json& a_json, SocketGroupRecord& a_outRecord);
	[[nodiscard]] bool FromJson(const nlohmann::json& a_json, CharacterSnapshot& a_outCharacter);
}
