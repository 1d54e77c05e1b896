#include "GemLink/LinkResolver.h"

namespace GemLink
{
	bool SupportCanModify(const SkillGemInstance& a_support, const SkillGemInstance& a_active)
	{
		if (!a_support.IsSupport() || !a_active.IsActive()) {
			return false;
		}
		return AreTagsCompatible(a_support.Tags(), a_active.Tags());
	}

	std::vector<const SkillGemInstance*> GetLinkedSupports(
		const SocketGroup& a_group,
		std::size_t a_activeSocketIndex)
	{
		std::vector<const SkillGemInstance*> supports;

		const auto* active = a_group.GetGem(a_activeSocketIndex);
		if (!active || !active->IsActive()) {
			return supports;
		}

		for (const auto neighbour : a_group.GetLinkedSockets(a_activeSocketIndex)) {
			const auto* gem = a_group.GetGem(neighbour);
			if (!gem || !SupportCanModify(*gem, *active)) {
				continue;
			}
			supports.push_back(gem);
		}

		return supports;
	}

	std::vector<SkillSetup> ActiveSkillSetups(const SocketGroup& a_group)
	{
		std::vector<SkillSetup> setups;

		for (std::size_t i = 0; i < a_group.SocketCount(); ++i) {
			const auto* gem = a_group.GetGem(i);
			if (!gem || !gem->IsActive()) {
				continue;
			}

			setups.push_back(SkillSetup{
				.activeGem = gem,
				.supportGems = GetLinkedSupports(a_group, i),
				.socketIndex = i });
		}

		return setups;
	}
}
