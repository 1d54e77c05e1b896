#include "GemLink/GemTemplateRegistry.h"

#include "GemLink/GemCatalogContract.h"
#include "GemLink/TextMatch.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace GemLink
{
	namespace
	{
		[[nodiscard]] std::vector<std::string> NormalizeTags(const std::vector<std::string>& a_tags)
		{
			std::vector<std::string> out;
			out.reserve(a_tags.size());
			for (const auto& tag : a_tags) {
				if (tag.empty()) {
					continue;
				}
				auto lowered = detail::ToLowerAscii(tag);
				if (std::find(out.begin(), out.end(), lowered) == out.end()) {
					out.push_back(std::move(lowered));
				}
			}
			return out;
		}

		[[nodiscard]] bool MatchesQuery(const GemTemplate& a_template, std::string_view a_query)
		{
			if (a_query.empty()) {
				return true;
			}
			return detail::ContainsCaseInsensitiveAscii(a_template.name, a_query) ||
			       detail::ContainsCaseInsensitiveAscii(a_template.description, a_query) ||
			       detail::AnyContainsCaseInsensitiveAscii(a_template.tags, a_query);
		}

		[[nodiscard]] GemTemplateRegistry BuildSingleton()
		{
			GemCatalogSnapshot snapshot{};
			const bool loaded = LoadGemCatalogSnapshotFromRuntime(GemCatalogContract::kGemCatalogRelativePath, snapshot);

			GemTemplateRegistry registry{};
			if (loaded && registry.LoadSnapshot(snapshot)) {
				spdlog::info(
					"GemLink: loaded {} gem templates from {}.",
					registry.Size(),
					GemCatalogContract::kGemCatalogRelativePath);
				return registry;
			}

			spdlog::warn("GemLink: using built-in gem catalog.");
			GemTemplateRegistry fallback{};
			if (!fallback.LoadSnapshot(MakeBuiltInGemCatalogSnapshot())) {
				spdlog::error("GemLink: built-in gem catalog failed to register.");
			}
			return fallback;
		}
	}

	const GemTemplateRegistry& GemTemplateRegistry::GetSingleton()
	{
		static const GemTemplateRegistry singleton = BuildSingleton();
		return singleton;
	}

	OperationResult GemTemplateRegistry::RegisterActive(
		std::string_view a_id,
		std::string_view a_name,
		const GemRequirements& a_requirements,
		const StatBlock& a_baseStats,
		std::string_view a_description,
		const std::vector<std::string>& a_tags)
	{
		return Register(GemTemplate{
			.id = std::string(a_id),
			.name = std::string(a_name),
			.kind = GemKind::kActive,
			.requirements = a_requirements,
			.baseStats = a_baseStats,
			.description = std::string(a_description),
			.tags = a_tags });
	}

	OperationResult GemTemplateRegistry::RegisterSupport(
		std::string_view a_id,
		std::string_view a_name,
		const GemRequirements& a_requirements,
		const StatBlock& a_baseStats,
		std::string_view a_description,
		const std::vector<std::string>& a_tags)
	{
		return Register(GemTemplate{
			.id = std::string(a_id),
			.name = std::string(a_name),
			.kind = GemKind::kSupport,
			.requirements = a_requirements,
			.baseStats = a_baseStats,
			.description = std::string(a_description),
			.tags = a_tags });
	}

	OperationResult GemTemplateRegistry::Register(GemTemplate a_template)
	{
		if (a_template.id.empty() || a_template.name.empty() || a_template.maxLevel == 0u) {
			spdlog::error("GemLink: rejected gem template '{}' (empty id/name or zero max level).", a_template.id);
			return OperationResult::Fail(GemErrorCode::kInvalidTemplate);
		}

		if (_indexById.find(a_template.id) != _indexById.end()) {
			spdlog::error("GemLink: duplicate gem template id '{}'.", a_template.id);
			return OperationResult::Fail(GemErrorCode::kDuplicateTemplateId);
		}

		a_template.tags = NormalizeTags(a_template.tags);
		a_template.socketColor = ResolveSocketColor(a_template.requirements);

		_indexById.emplace(a_template.id, _templates.size());
		_templates.push_back(std::move(a_template));
		return OperationResult::Ok();
	}

	void GemTemplateRegistry::RegisterClassStarterGems(
		std::string_view a_className,
		const std::vector<std::string>& a_gemIds)
	{
		if (a_className.empty()) {
			return;
		}

		ClassStarterEntry entry{ .className = std::string(a_className) };
		entry.gemIds.reserve(a_gemIds.size());
		for (const auto& gemId : a_gemIds) {
			if (!Contains(gemId)) {
				spdlog::warn("GemLink: class '{}' starter gem '{}' is not registered; skipped.", a_className, gemId);
				continue;
			}
			entry.gemIds.push_back(gemId);
		}

		const auto existing = std::find_if(_classStarters.begin(), _classStarters.end(), [&](const ClassStarterEntry& a_entry) {
			return detail::EqualsCaseInsensitiveAscii(a_entry.className, a_className);
		});
		if (existing != _classStarters.end()) {
			*existing = std::move(entry);
			return;
		}
		_classStarters.push_back(std::move(entry));
	}

	OperationResult GemTemplateRegistry::LoadSnapshot(const GemCatalogSnapshot& a_snapshot)
	{
		for (const auto& row : a_snapshot.gems) {
			auto result = Register(GemTemplate{
				.id = row.id,
				.name = row.name,
				.kind = row.kind,
				.requirements = row.requirements,
				.baseStats = row.stats,
				.description = row.description,
				.tags = row.tags,
				.maxLevel = row.maxLevel,
				.maxQuality = row.maxQuality });
			if (!result) {
				return result;
			}
		}

		for (const auto& row : a_snapshot.classStarters) {
			RegisterClassStarterGems(row.className, row.gemIds);
		}
		return OperationResult::Ok();
	}

	const GemTemplate* GemTemplateRegistry::Find(std::string_view a_id) const
	{
		const auto it = _indexById.find(std::string(a_id));
		return it != _indexById.end() ? &_templates[it->second] : nullptr;
	}

	bool GemTemplateRegistry::Contains(std::string_view a_id) const
	{
		return Find(a_id) != nullptr;
	}

	std::optional<GemTemplate> GemTemplateRegistry::Lookup(std::string_view a_id) const
	{
		const auto* found = Find(a_id);
		if (!found) {
			return std::nullopt;
		}
		return *found;
	}

	std::optional<SkillGemInstance> GemTemplateRegistry::Instantiate(std::string_view a_id) const
	{
		const auto* found = Find(a_id);
		if (!found) {
			return std::nullopt;
		}
		return SkillGemInstance(*found);
	}

	std::vector<GemTemplate> GemTemplateRegistry::CollectKind(GemKind a_kind, std::string_view a_query) const
	{
		std::vector<GemTemplate> out;
		for (const auto& gemTemplate : _templates) {
			if (gemTemplate.kind == a_kind && MatchesQuery(gemTemplate, a_query)) {
				out.push_back(gemTemplate);
			}
		}
		return out;
	}

	std::vector<GemTemplate> GemTemplateRegistry::Search(std::string_view a_query, KindFilter a_filter) const
	{
		std::vector<GemTemplate> out;
		if (a_filter != KindFilter::kSupport) {
			out = CollectKind(GemKind::kActive, a_query);
		}
		if (a_filter != KindFilter::kActive) {
			auto supports = CollectKind(GemKind::kSupport, a_query);
			out.insert(out.end(), std::make_move_iterator(supports.begin()), std::make_move_iterator(supports.end()));
		}
		return out;
	}

	std::vector<GemTemplate> GemTemplateRegistry::GemsForClass(std::string_view a_className) const
	{
		std::vector<GemTemplate> out;
		for (const auto& entry : _classStarters) {
			if (!detail::EqualsCaseInsensitiveAscii(entry.className, a_className)) {
				continue;
			}
			out.reserve(entry.gemIds.size());
			for (const auto& gemId : entry.gemIds) {
				if (const auto* found = Find(gemId)) {
					out.push_back(*found);
				}
			}
			break;
		}
		return out;
	}

	std::vector<GemTemplate> GemTemplateRegistry::AllActive() const
	{
		return CollectKind(GemKind::kActive, {});
	}

	std::vector<GemTemplate> GemTemplateRegistry::AllSupport() const
	{
		return CollectKind(GemKind::kSupport, {});
	}
}
