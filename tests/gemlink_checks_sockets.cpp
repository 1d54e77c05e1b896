#include "gemlink_checks_common.h"

#include "GemLink/GemError.h"

#include <array>

namespace GemLinkChecks
{
	bool CheckSocketPlacement()
	{
		using GemLink::GemErrorCode;
		using GemLink::SocketColor;

		const auto registry = MakeBuiltInRegistry();
		constexpr std::array<SocketColor, 3> layout{ SocketColor::kRed, SocketColor::kWhite, SocketColor::kBlue };
		GemLink::SocketGroup group(layout);

		auto fireball = MakeGem(registry, "fireball");
		(void)fireball.AddExperience(1500);
		const auto heavyStrike = MakeGem(registry, "heavy_strike");

		// Empty white accepts any color; empty colored only its own color.
		if (!group.GetSocket(1)->CanAccept(fireball) || !group.GetSocket(1)->CanAccept(heavyStrike) ||
		    group.GetSocket(0)->CanAccept(fireball) || !group.GetSocket(0)->CanAccept(heavyStrike)) {
			std::cerr << "sockets: unexpected CanAccept result for empty sockets\n";
			return false;
		}

		// Blue gem into a red socket: rejected, caller keeps the gem.
		const auto mismatch = group.SocketGem(0, std::move(fireball));
		if (mismatch || mismatch.code != GemErrorCode::kSocketColorMismatch || group.GetGem(0) != nullptr) {
			std::cerr << "sockets: expected color mismatch to be rejected\n";
			return false;
		}
		if (fireball.TemplateId() != "fireball" || fireball.Level() != 2u) {
			std::cerr << "sockets: expected rejected gem to stay with the caller\n";
			return false;
		}

		// White accepts any color.
		if (!group.SocketGem(1, std::move(fireball)) || !group.GetGem(1) || group.GetGem(1)->TemplateId() != "fireball") {
			std::cerr << "sockets: expected white socket to accept a blue gem\n";
			return false;
		}

		// Occupied socket accepts nothing, even a gem of a matching color.
		auto iceNova = MakeGem(registry, "ice_nova");
		if (group.GetSocket(1)->CanAccept(iceNova) || group.GetSocket(1)->CanAccept(heavyStrike)) {
			std::cerr << "sockets: expected occupied socket to accept nothing\n";
			return false;
		}

		// Occupied socket fails and keeps its gem.
		const auto occupied = group.SocketGem(1, std::move(iceNova));
		if (occupied || occupied.code != GemErrorCode::kSocketOccupied ||
		    group.GetGem(1)->TemplateId() != "fireball" || iceNova.TemplateId() != "ice_nova") {
			std::cerr << "sockets: expected occupied socket to reject without side effects\n";
			return false;
		}

		const auto outOfRange = group.SocketGem(7, std::move(iceNova));
		if (outOfRange || outOfRange.code != GemErrorCode::kSocketIndexOutOfRange) {
			std::cerr << "sockets: expected out-of-range socket index to be rejected\n";
			return false;
		}

		if (!group.SocketGem(2, std::move(iceNova))) {
			std::cerr << "sockets: expected blue socket to accept ice_nova\n";
			return false;
		}

		// Unsocket hands the instance back with its progress.
		auto removed = group.UnsocketGem(1);
		if (!removed || removed->Level() != 2u || group.GetGem(1) != nullptr || group.UnsocketGem(1).has_value()) {
			std::cerr << "sockets: expected unsocket to return the gem once\n";
			return false;
		}

		if (group.GetLayout() != std::vector<SocketColor>(layout.begin(), layout.end())) {
			std::cerr << "sockets: expected layout to be preserved\n";
			return false;
		}

		return true;
	}

	bool CheckSocketLinks()
	{
		using GemLink::GemErrorCode;
		using GemLink::SocketColor;

		constexpr std::array<SocketColor, 3> layout{ SocketColor::kWhite, SocketColor::kWhite, SocketColor::kWhite };
		GemLink::SocketGroup group(layout);

		if (!group.AddLink(0, 1) || !group.IsLinked(0, 1) || !group.IsLinked(1, 0)) {
			std::cerr << "links: expected AddLink(0,1) to be symmetric\n";
			return false;
		}

		// Idempotent.
		if (!group.AddLink(1, 0) || group.GetLinks().size() != 1u || group.GetLinkedSockets(0).size() != 1u) {
			std::cerr << "links: expected repeated AddLink to be a no-op\n";
			return false;
		}

		const auto self = group.AddLink(2, 2);
		const auto outOfRange = group.AddLink(0, 3);
		if (self || self.code != GemErrorCode::kSelfLink || outOfRange || outOfRange.code != GemErrorCode::kSocketIndexOutOfRange ||
		    group.GetLinks().size() != 1u) {
			std::cerr << "links: expected self and out-of-range links to be rejected\n";
			return false;
		}

		// Cycles are allowed.
		if (!group.AddLink(1, 2) || !group.AddLink(2, 0) || group.GetLinks().size() != 3u) {
			std::cerr << "links: expected a cycle of three links\n";
			return false;
		}

		if (!group.RemoveLink(1, 0) || group.IsLinked(0, 1) || group.IsLinked(1, 0) || group.GetLinks().size() != 2u) {
			std::cerr << "links: expected RemoveLink to clear both directions\n";
			return false;
		}
		if (group.GetLinks().front() != GemLink::SocketLink{ 1, 2 }) {
			std::cerr << "links: expected remaining links to keep insertion order\n";
			return false;
		}

		if (!group.RemoveLink(0, 1)) {
			std::cerr << "links: expected removing a missing link to succeed\n";
			return false;
		}

		return true;
	}

	bool CheckActiveSkillSetups()
	{
		using GemLink::SocketColor;

		const auto registry = MakeBuiltInRegistry();
		constexpr std::array<SocketColor, 4> layout{ SocketColor::kBlue, SocketColor::kWhite, SocketColor::kBlue, SocketColor::kGreen };
		GemLink::SocketGroup group(layout);

		// Socket the higher index first; setups still come back by ascending index.
		if (!group.SocketGem(2, MakeGem(registry, "ice_nova")) ||
		    !group.SocketGem(0, MakeGem(registry, "fireball")) ||
		    !group.SocketGem(1, MakeGem(registry, "added_fire_damage")) ||
		    !group.SocketGem(3, MakeGem(registry, "critical_strikes"))) {
			std::cerr << "setups: expected all gems to socket\n";
			return false;
		}

		if (!group.AddLink(2, 1) || !group.AddLink(0, 3) || !group.AddLink(0, 1) || !group.AddLink(2, 3)) {
			std::cerr << "setups: expected links to be added\n";
			return false;
		}

		const auto setups = GemLink::ActiveSkillSetups(group);
		if (setups.size() != 2u || setups[0].socketIndex != 0u || setups[1].socketIndex != 2u) {
			std::cerr << "setups: expected setups at sockets 0 and 2\n";
			return false;
		}

		// Fireball: both supports, in link order.
		const auto& fire = setups[0];
		if (fire.activeGem->TemplateId() != "fireball" || fire.supportGems.size() != 2u ||
		    fire.supportGems[0]->TemplateId() != "critical_strikes" ||
		    fire.supportGems[1]->TemplateId() != "added_fire_damage") {
			std::cerr << "setups: unexpected fireball supports\n";
			return false;
		}

		// Ice Nova: fire-only support is filtered out, the untagged one is shared.
		const auto& cold = setups[1];
		if (cold.activeGem->TemplateId() != "ice_nova" || cold.supportGems.size() != 1u ||
		    cold.supportGems[0]->TemplateId() != "critical_strikes" || cold.supportGems[0] != fire.supportGems[0]) {
			std::cerr << "setups: expected ice_nova to receive only the untagged support\n";
			return false;
		}

		if (!GemLink::GetLinkedSupports(group, 1).empty() || !GemLink::GetLinkedSupports(group, 9).empty()) {
			std::cerr << "setups: expected no supports for non-active sockets\n";
			return false;
		}

		// Unlinking drops the support from the setup.
		if (!group.RemoveLink(0, 1) || GemLink::ActiveSkillSetups(group)[0].supportGems.size() != 1u) {
			std::cerr << "setups: expected unlinked support to drop out\n";
			return false;
		}

		return true;
	}
}
