#pragma once

#include "GemLink/SkillGemInstance.h"
#include "GemLink/SocketGroup.h"

#include <cstddef>
#include <string_view>
#include <vector>

namespace GemLink
{
	// Non-owning view into a SocketGroup. Invalidated by any mutation of that group.
	struct SkillSetup
	{
		const SkillGemInstance* activeGem{ nullptr };
		std::vector<const SkillGemInstance*> supportGems{};
		std::size_t socketIndex{ 0 };
	};

	// An untagged support modifies anything; otherwise at least one tag must be shared.
	template <class SupportTags, class ActiveTags>
	[[nodiscard]] constexpr bool AreTagsCompatible(const SupportTags& a_supportTags, const ActiveTags& a_activeTags) noexcept
	{
		bool supportHasTags = false;
		for (const auto& rawSupportTag : a_supportTags) {
			supportHasTags = true;
			const std::string_view supportTag{ rawSupportTag };
			for (const auto& rawActiveTag : a_activeTags) {
				if (supportTag == std::string_view{ rawActiveTag }) {
					return true;
				}
			}
		}
		return !supportHasTags;
	}

	[[nodiscard]] bool SupportCanModify(const SkillGemInstance& a_support, const SkillGemInstance& a_active);

	// Supports linked to the active gem at a_activeSocketIndex, in link order.
	[[nodiscard]] std::vector<const SkillGemInstance*> GetLinkedSupports(
		const SocketGroup& a_group,
		std::size_t a_activeSocketIndex);

	// One setup per socketed active gem, by ascending socket index.
	[[nodiscard]] std::vector<SkillSetup> ActiveSkillSetups(const SocketGroup& a_group);
}
