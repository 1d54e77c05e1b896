#include "GemLink/GemStateSerialization.h"

#include "GemLink/GemStateContract.h"

#include <limits>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace GemLink
{
	namespace
	{
		[[nodiscard]] const nlohmann::json* FindField(const nlohmann::json& a_object, std::string_view a_key)
		{
			const auto it = a_object.find(std::string(a_key));
			return it == a_object.end() ? nullptr : &(*it);
		}

		template <class T>
		[[nodiscard]] bool TryReadUnsigned(const nlohmann::json& a_object, std::string_view a_key, bool a_required, T& a_inOutValue)
		{
			const auto* field = FindField(a_object, a_key);
			if (!field || field->is_null()) {
				return !a_required;
			}
			if (field->is_number_unsigned()) {
				const auto value = field->get<std::uint64_t>();
				if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
					return false;
				}
				a_inOutValue = static_cast<T>(value);
				return true;
			}
			if (field->is_number_integer()) {
				const auto value = field->get<std::int64_t>();
				if (value < 0 || static_cast<std::uint64_t>(value) > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
					return false;
				}
				a_inOutValue = static_cast<T>(value);
				return true;
			}
			return false;
		}

		[[nodiscard]] bool TryReadNumber(const nlohmann::json& a_object, std::string_view a_key, double& a_inOutValue)
		{
			const auto* field = FindField(a_object, a_key);
			if (!field || field->is_null()) {
				return true;
			}
			if (!field->is_number()) {
				return false;
			}
			a_inOutValue = field->get<double>();
			return true;
		}

		[[nodiscard]] bool TryReadString(const nlohmann::json& a_object, std::string_view a_key, bool a_required, std::string& a_outValue)
		{
			const auto* field = FindField(a_object, a_key);
			if (!field || field->is_null()) {
				return !a_required;
			}
			if (!field->is_string()) {
				return false;
			}
			a_outValue = field->get<std::string>();
			return !a_required || !a_outValue.empty();
		}

		[[nodiscard]] bool ParseLink(const nlohmann::json& a_json, SocketLink& a_outLink)
		{
			if (!a_json.is_array() || a_json.size() != 2u) {
				return false;
			}
			for (const auto& index : a_json) {
				if (!index.is_number_unsigned() && !(index.is_number_integer() && index.get<std::int64_t>() >= 0)) {
					return false;
				}
			}
			a_outLink.first = a_json[0].get<std::size_t>();
			a_outLink.second = a_json[1].get<std::size_t>();
			return true;
		}
	}

	GemInstanceRecord CaptureGemInstance(const SkillGemInstance& a_gem)
	{
		return GemInstanceRecord{
			.templateId = a_gem.TemplateId(),
			.level = a_gem.Level(),
			.experience = a_gem.Experience(),
			.quality = a_gem.Quality()
		};
	}

	SocketGroupRecord CaptureSocketGroup(const SocketGroup& a_group)
	{
		SocketGroupRecord record{};
		record.sockets.reserve(a_group.SocketCount());
		for (std::size_t i = 0; i < a_group.SocketCount(); ++i) {
			const auto* socket = a_group.GetSocket(i);
			SocketRecord socketRecord{ .color = socket->Color() };
			if (const auto* gem = socket->Gem()) {
				socketRecord.gem = CaptureGemInstance(*gem);
			}
			record.sockets.push_back(std::move(socketRecord));
		}
		record.links = a_group.GetLinks();
		return record;
	}

	OperationResult RestoreGemInstance(
		const GemTemplateRegistry& a_registry,
		const GemInstanceRecord& a_record,
		std::optional<SkillGemInstance>& a_outGem)
	{
		a_outGem.reset();

		auto gem = a_registry.Instantiate(a_record.templateId);
		if (!gem) {
			spdlog::warn("GemLink: restore skipped unknown gem template '{}'.", a_record.templateId);
			return OperationResult::Fail(GemErrorCode::kUnknownTemplateId);
		}

		const auto result = gem->RestoreProgress(a_record.level, a_record.experience, a_record.quality);
		if (!result) {
			spdlog::warn(
				"GemLink: restore rejected gem '{}' (level {}, quality {}): {}.",
				a_record.templateId,
				a_record.level,
				a_record.quality,
				DescribeGemError(result.code));
			return result;
		}

		a_outGem = std::move(gem);
		return OperationResult::Ok();
	}

	OperationResult RestoreSocketGroup(
		const GemTemplateRegistry& a_registry,
		const SocketGroupRecord& a_record,
		SocketGroup& a_outGroup)
	{
		SocketGroup restored{};
		for (const auto& socketRecord : a_record.sockets) {
			const auto index = restored.AddSocket(socketRecord.color);
			if (!socketRecord.gem) {
				continue;
			}

			std::optional<SkillGemInstance> gem;
			if (const auto result = RestoreGemInstance(a_registry, *socketRecord.gem, gem); !result) {
				return result;
			}
			if (const auto result = restored.SocketGem(index, std::move(*gem)); !result) {
				spdlog::warn(
					"GemLink: restore could not socket '{}' at {}: {}.",
					socketRecord.gem->templateId,
					index,
					DescribeGemError(result.code));
				return result;
			}
		}

		for (const auto& link : a_record.links) {
			if (const auto result = restored.AddLink(link.first, link.second); !result) {
				spdlog::warn(
					"GemLink: restore rejected link {}-{}: {}.",
					link.first,
					link.second,
					DescribeGemError(result.code));
				return result;
			}
		}

		a_outGroup = std::move(restored);
		return OperationResult::Ok();
	}

	nlohmann::json ToJson(const GemInstanceRecord& a_record)
	{
		nlohmann::json json = nlohmann::json::object();
		json[std::string(GemStateContract::kFieldGemTemplateId)] = a_record.templateId;
		json[std::string(GemStateContract::kFieldGemLevel)] = a_record.level;
		json[std::string(GemStateContract::kFieldGemExperience)] = a_record.experience;
		json[std::string(GemStateContract::kFieldGemQuality)] = a_record.quality;
		return json;
	}

	nlohmann::json ToJson(const SocketGroupRecord& a_record)
	{
		nlohmann::json sockets = nlohmann::json::array();
		for (const auto& socketRecord : a_record.sockets) {
			nlohmann::json socket = nlohmann::json::object();
			socket[std::string(GemStateContract::kFieldSocketColor)] = std::string(DescribeSocketColor(socketRecord.color));
			if (socketRecord.gem) {
				socket[std::string(GemStateContract::kFieldSocketGem)] = ToJson(*socketRecord.gem);
			}
			sockets.push_back(std::move(socket));
		}

		nlohmann::json links = nlohmann::json::array();
		for (const auto& link : a_record.links) {
			links.push_back(nlohmann::json::array({ link.first, link.second }));
		}

		nlohmann::json json = nlohmann::json::object();
		json[std::string(GemStateContract::kFieldSockets)] = std::move(sockets);
		json[std::string(GemStateContract::kFieldLinks)] = std::move(links);
		return json;
	}

	nlohmann::json ToJson(const CharacterSnapshot& a_character)
	{
		nlohmann::json modifiers = nlohmann::json::array();
		for (const auto& modifier : a_character.modifiers) {
			nlohmann::json entry = nlohmann::json::object();
			entry[std::string(GemStateContract::kFieldModifierTag)] = modifier.tag;
			entry[std::string(GemStateContract::kFieldModifierStat)] = std::string(DescribeModifierStat(modifier.stat));
			entry[std::string(GemStateContract::kFieldModifierPercent)] = modifier.percent;
			modifiers.push_back(std::move(entry));
		}

		nlohmann::json json = nlohmann::json::object();
		json[std::string(GemStateContract::kFieldCharacterLevel)] = a_character.level;
		json[std::string(GemStateContract::kFieldCharacterStrength)] = a_character.strength;
		json[std::string(GemStateContract::kFieldCharacterDexterity)] = a_character.dexterity;
		json[std::string(GemStateContract::kFieldCharacterIntelligence)] = a_character.intelligence;
		json[std::string(GemStateContract::kFieldCharacterResourceCurrent)] = a_character.resourceCurrent;
		json[std::string(GemStateContract::kFieldCharacterResourceMax)] = a_character.resourceMax;
		json[std::string(GemStateContract::kFieldCharacterModifiers)] = std::move(modifiers);
		return json;
	}

	bool FromJson(const nlohmann::json& a_json, GemInstanceRecord& a_outRecord)
	{
		if (!a_json.is_object()) {
			return false;
		}

		GemInstanceRecord record{};
		if (!TryReadString(a_json, GemStateContract::kFieldGemTemplateId, true, record.templateId) ||
		    !TryReadUnsigned(a_json, GemStateContract::kFieldGemLevel, false, record.level) ||
		    !TryReadUnsigned(a_json, GemStateContract::kFieldGemExperience, false, record.experience) ||
		    !TryReadUnsigned(a_json, GemStateContract::kFieldGemQuality, false, record.quality)) {
			return false;
		}

		a_outRecord = std::move(record);
		return true;
	}

	bool FromJson(const nlohmann::json& a_json, SocketGroupRecord& a_outRecord)
	{
		if (!a_json.is_object()) {
			return false;
		}

		const auto* sockets = FindField(a_json, GemStateContract::kFieldSockets);
		if (!sockets || !sockets->is_array()) {
			return false;
		}

		SocketGroupRecord record{};
		record.sockets.reserve(sockets->size());
		for (const auto& entry : *sockets) {
			if (!entry.is_object()) {
				return false;
			}

			std::string colorText;
			if (!TryReadString(entry, GemStateContract::kFieldSocketColor, true, colorText)) {
				return false;
			}
			const auto color = ParseSocketColor(colorText);
			if (!color) {
				return false;
			}

			SocketRecord socketRecord{ .color = *color };
			if (const auto* gem = FindField(entry, GemStateContract::kFieldSocketGem); gem && !gem->is_null()) {
				GemInstanceRecord gemRecord{};
				if (!FromJson(*gem, gemRecord)) {
					return false;
				}
				socketRecord.gem = std::move(gemRecord);
			}
			record.sockets.push_back(std::move(socketRecord));
		}

		if (const auto* links = FindField(a_json, GemStateContract::kFieldLinks); links && !links->is_null()) {
			if (!links->is_array()) {
				return false;
			}
			record.links.reserve(links->size());
			for (const auto& entry : *links) {
				SocketLink link{};
				if (!ParseLink(entry, link)) {
					return false;
				}
				record.links.push_back(link);
			}
		}

		a_outRecord = std::move(record);
		return true;
	}

	bool FromJson(const nlohmann::json& a_json, CharacterSnapshot& a_outCharacter)
	{
		if (!a_json.is_object()) {
			return false;
		}

		CharacterSnapshot character{};
		if (!TryReadUnsigned(a_json, GemStateContract::kFieldCharacterLevel, false, character.level) ||
		    !TryReadUnsigned(a_json, GemStateContract::kFieldCharacterStrength, false, character.strength) ||
		    !TryReadUnsigned(a_json, GemStateContract::kFieldCharacterDexterity, false, character.dexterity) ||
		    !TryReadUnsigned(a_json, GemStateContract::kFieldCharacterIntelligence, false, character.intelligence) ||
		    !TryReadNumber(a_json, GemStateContract::kFieldCharacterResourceCurrent, character.resourceCurrent) ||
		    !TryReadNumber(a_json, GemStateContract::kFieldCharacterResourceMax, character.resourceMax)) {
			return false;
		}

		if (const auto* modifiers = FindField(a_json, GemStateContract::kFieldCharacterModifiers); modifiers && !modifiers->is_null()) {
			if (!modifiers->is_array()) {
				return false;
			}
			for (const auto& entry : *modifiers) {
				if (!entry.is_object()) {
					return false;
				}

				CharacterModifier modifier{};
				std::string statText;
				if (!TryReadString(entry, GemStateContract::kFieldModifierTag, false, modifier.tag) ||
				    !TryReadString(entry, GemStateContract::kFieldModifierStat, true, statText) ||
				    !TryReadNumber(entry, GemStateContract::kFieldModifierPercent, modifier.percent)) {
					return false;
				}

				const auto stat = ParseModifierStat(statText);
				if (!stat) {
					return false;
				}
				modifier.stat = *stat;
				character.modifiers.push_back(std::move(modifier));
			}
		}

		a_outCharacter = std::move(character);
		return true;
	}
}
