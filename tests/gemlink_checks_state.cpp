#include "gemlink_checks_common.h"

#include "GemLink/GemError.h"
#include "GemLink/GemStateSerialization.h"

#include <array>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace GemLinkChecks
{
	namespace
	{
		[[nodiscard]] bool BuildSampleGroup(const GemLink::GemTemplateRegistry& a_registry, GemLink::SocketGroup& a_outGroup)
		{
			using GemLink::SocketColor;

			constexpr std::array<SocketColor, 4> layout{ SocketColor::kBlue, SocketColor::kWhite, SocketColor::kGreen, SocketColor::kRed };
			GemLink::SocketGroup group(layout);

			auto fireball = MakeGem(a_registry, "fireball");
			auto support = MakeGem(a_registry, "added_fire_damage");
			if (!fireball.AddExperience(2345) || !fireball.SetQuality(13) || !support.SetQuality(5)) {
				return false;
			}

			if (!group.SocketGem(0, std::move(fireball)) ||
			    !group.SocketGem(1, std::move(support)) ||
			    !group.AddLink(1, 0) ||
			    !group.AddLink(2, 3) ||
			    !group.AddLink(0, 2)) {
				return false;
			}

			a_outGroup = std::move(group);
			return true;
		}
	}

	bool CheckStateRecordRoundTrip()
	{
		const auto registry = MakeBuiltInRegistry();
		GemLink::SocketGroup group{};
		if (!BuildSampleGroup(registry, group)) {
			std::cerr << "state: expected sample group to build\n";
			return false;
		}

		const auto record = GemLink::CaptureSocketGroup(group);
		if (record.sockets.size() != 4u || !record.sockets[0].gem || record.sockets[2].gem ||
		    record.links.size() != 3u || record.links[0] != GemLink::SocketLink{ 1, 0 }) {
			std::cerr << "state: unexpected captured record\n";
			return false;
		}

		const auto& fireRecord = *record.sockets[0].gem;
		if (fireRecord.templateId != "fireball" || fireRecord.level != 3u || fireRecord.experience != 245u || fireRecord.quality != 13u) {
			std::cerr << "state: unexpected captured fireball progress\n";
			return false;
		}

		// JSON text round trip.
		const auto text = GemLink::ToJson(record).dump();
		GemLink::SocketGroupRecord parsed{};
		if (!GemLink::FromJson(nlohmann::json::parse(text), parsed) || !(parsed == record)) {
			std::cerr << "state: expected record to survive JSON round trip\n";
			return false;
		}

		GemLink::SocketGroup restored{};
		if (!GemLink::RestoreSocketGroup(registry, parsed, restored)) {
			std::cerr << "state: expected restore to succeed\n";
			return false;
		}
		if (!(GemLink::CaptureSocketGroup(restored) == record)) {
			std::cerr << "state: expected restored group to capture identically\n";
			return false;
		}

		// Restored group resolves the same setups.
		const auto before = GemLink::ActiveSkillSetups(group);
		const auto after = GemLink::ActiveSkillSetups(restored);
		if (before.size() != 1u || after.size() != 1u ||
		    !(GemLink::CalculateSkillDamage(before[0], GemLink::CharacterSnapshot{}) ==
		      GemLink::CalculateSkillDamage(after[0], GemLink::CharacterSnapshot{}))) {
			std::cerr << "state: expected restored setups to compose identically\n";
			return false;
		}

		GemLink::CharacterSnapshot character{ .level = 40, .strength = 10, .dexterity = 20, .intelligence = 90, .resourceCurrent = 55.5, .resourceMax = 120.0 };
		character.modifiers = { { .tag = "spell", .stat = GemLink::ModifierStat::kCastSpeedIncreased, .percent = 12.5 } };
		GemLink::CharacterSnapshot characterCopy{};
		if (!GemLink::FromJson(GemLink::ToJson(character), characterCopy) ||
		    characterCopy.level != 40u || characterCopy.intelligence != 90u || characterCopy.resourceCurrent != 55.5 ||
		    characterCopy.modifiers.size() != 1u || characterCopy.modifiers[0].tag != "spell" ||
		    characterCopy.modifiers[0].stat != GemLink::ModifierStat::kCastSpeedIncreased ||
		    characterCopy.modifiers[0].percent != 12.5) {
			std::cerr << "state: expected character snapshot to survive JSON round trip\n";
			return false;
		}

		return true;
	}

	bool CheckStateRestoreRejection()
	{
		using GemLink::GemErrorCode;

		const auto registry = MakeBuiltInRegistry();
		GemLink::SocketGroup group{};
		if (!BuildSampleGroup(registry, group)) {
			std::cerr << "state: expected sample group to build\n";
			return false;
		}
		const auto original = GemLink::CaptureSocketGroup(group);

		auto unknown = original;
		unknown.sockets[0].gem->templateId = "retired_gem";
		const auto unknownResult = GemLink::RestoreSocketGroup(registry, unknown, group);
		if (unknownResult || unknownResult.code != GemErrorCode::kUnknownTemplateId ||
		    unknownResult.Category() != GemLink::GemErrorCategory::kLookupMiss ||
		    !(GemLink::CaptureSocketGroup(group) == original)) {
			std::cerr << "state: expected unknown template to fail without touching the group\n";
			return false;
		}

		auto badLevel = original;
		badLevel.sockets[0].gem->level = 99;
		if (GemLink::RestoreSocketGroup(registry, badLevel, group).code != GemErrorCode::kLevelOutOfRange) {
			std::cerr << "state: expected out-of-range level to be rejected\n";
			return false;
		}

		auto wrongColor = original;
		wrongColor.sockets[0].color = GemLink::SocketColor::kRed;
		if (GemLink::RestoreSocketGroup(registry, wrongColor, group).code != GemErrorCode::kSocketColorMismatch) {
			std::cerr << "state: expected color mismatch to be rejected\n";
			return false;
		}

		auto badLink = original;
		badLink.links.push_back(GemLink::SocketLink{ 2, 9 });
		if (GemLink::RestoreSocketGroup(registry, badLink, group).code != GemErrorCode::kSocketIndexOutOfRange ||
		    !(GemLink::CaptureSocketGroup(group) == original)) {
			std::cerr << "state: expected dangling link to be rejected\n";
			return false;
		}

		GemLink::SocketGroupRecord parsed{};
		const auto badJson = nlohmann::json::parse(R"({"sockets":[{"color":"purple"}],"links":[]})");
		const auto badLinkJson = nlohmann::json::parse(R"({"sockets":[{"color":"red"}],"links":[[0,-1]]})");
		const auto badGemJson = nlohmann::json::parse(R"({"sockets":[{"color":"red","gem":{"level":2}}]})");
		if (GemLink::FromJson(badJson, parsed) || GemLink::FromJson(badLinkJson, parsed) || GemLink::FromJson(badGemJson, parsed)) {
			std::cerr << "state: expected malformed records to be rejected\n";
			return false;
		}

		return true;
	}
}
