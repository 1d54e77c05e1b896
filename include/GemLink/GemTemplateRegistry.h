#pragma once

#include "GemLink/GemCatalogSnapshot.h"
#include "GemLink/GemError.h"
#include "GemLink/GemTemplate.h"
#include "GemLink/SkillGemInstance.h"
#include "GemLink/SocketColor.h"
#include "GemLink/StatBlock.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace GemLink
{
	class GemTemplateRegistry
	{
	public:
		enum class KindFilter : std::uint8_t
		{
			kAll = 0,
			kActive,
			kSupport,
		};

		// Built once from the runtime catalog file, or from the compiled catalog when the file is
		// missing or invalid. Never mutated afterwards.
		[[nodiscard]] static const GemTemplateRegistry& GetSingleton();

		GemTemplateRegistry() = default;

		OperationResult RegisterActive(
			std::string_view a_id,
			std::string_view a_name,
			const GemRequirements& a_requirements,
			const StatBlock& a_baseStats,
			std::string_view a_description,
			const std::vector<std::string>& a_tags);

		OperationResult RegisterSupport(
			std::string_view a_id,
			std::string_view a_name,
			const GemRequirements& a_requirements,
			const StatBlock& a_baseStats,
			std::string_view a_description,
			const std::vector<std::string>& a_tags);

		// Socket color is derived here; the value in a_template is ignored.
		OperationResult Register(GemTemplate a_template);

		// Unknown gem ids are skipped with a warning.
		void RegisterClassStarterGems(std::string_view a_className, const std::vector<std::string>& a_gemIds);

		// Registers every row; stops at the first rejected row.
		OperationResult LoadSnapshot(const GemCatalogSnapshot& a_snapshot);

		[[nodiscard]] bool Contains(std::string_view a_id) const;
		[[nodiscard]] std::optional<GemTemplate> Lookup(std::string_view a_id) const;
		[[nodiscard]] std::optional<SkillGemInstance> Instantiate(std::string_view a_id) const;

		[[nodiscard]] std::vector<GemTemplate> Search(std::string_view a_query, KindFilter a_filter = KindFilter::kAll) const;
		[[nodiscard]] std::vector<GemTemplate> GemsForClass(std::string_view a_className) const;

		[[nodiscard]] std::vector<GemTemplate> AllActive() const;
		[[nodiscard]] std::vector<GemTemplate> AllSupport() const;
		[[nodiscard]] std::size_t Size() const noexcept { return _templates.size(); }

	private:
		struct ClassStarterEntry
		{
			std::string className{};
			std::vector<std::string> gemIds{};
		};

		[[nodiscard]] const GemTemplate* Find(std::string_view a_id) const;
		[[nodiscard]] std::vector<GemTemplate> CollectKind(GemKind a_kind, std::string_view a_query) const;

		std::vector<GemTemplate> _templates{};
		std::unordered_map<std::string, std::size_t> _indexById{};
		std::vector<ClassStarterEntry> _classStarters{};
	};
}
