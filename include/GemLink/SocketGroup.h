#pragma once

#include "GemLink/GemError.h"
#include "GemLink/SkillGemInstance.h"
#include "GemLink/SocketColor.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace GemLink
{
	struct SocketLink
	{
		std::size_t first{ 0 };
		std::size_t second{ 0 };

		[[nodiscard]] constexpr bool Connects(std::size_t a_lhs, std::size_t a_rhs) const noexcept
		{
			return (first == a_lhs && second == a_rhs) || (first == a_rhs && second == a_lhs);
		}

		[[nodiscard]] constexpr bool operator==(const SocketLink& a_rhs) const noexcept = default;
	};

	class SocketGroup;

	class Socket
	{
	public:
		explicit Socket(SocketColor a_color) noexcept :
			_color(a_color)
		{}

		[[nodiscard]] SocketColor Color() const noexcept { return _color; }
		[[nodiscard]] bool IsEmpty() const noexcept { return !_gem.has_value(); }
		[[nodiscard]] const SkillGemInstance* Gem() const noexcept { return _gem ? std::addressof(*_gem) : nullptr; }
		[[nodiscard]] SkillGemInstance* Gem() noexcept { return _gem ? std::addressof(*_gem) : nullptr; }

		// Neighbour socket indices, in the order the links were added.
		[[nodiscard]] std::span<const std::size_t> LinkedSockets() const noexcept { return _links; }
		[[nodiscard]] bool IsLinkedTo(std::size_t a_index) const noexcept;

		[[nodiscard]] bool CanAccept(const SkillGemInstance& a_gem) const noexcept;

		// Moves from a_gem only on success; on failure the caller still owns it.
		OperationResult SocketGem(SkillGemInstance&& a_gem);
		std::optional<SkillGemInstance> UnsocketGem() noexcept;

	private:
		friend class SocketGroup;

		SocketColor _color{ SocketColor::kWhite };
		std::optional<SkillGemInstance> _gem{};
		std::vector<std::size_t> _links{};
	};

	// Sockets of one item. Adjacency is stored as index lists; the graph may be cyclic or disconnected.
	class SocketGroup
	{
	public:
		SocketGroup() = default;
		explicit SocketGroup(std::span<const SocketColor> a_layout);

		std::size_t AddSocket(SocketColor a_color);

		[[nodiscard]] std::size_t SocketCount() const noexcept { return _sockets.size(); }
		[[nodiscard]] bool IsValidIndex(std::size_t a_index) const noexcept { return a_index < _sockets.size(); }
		[[nodiscard]] const Socket* GetSocket(std::size_t a_index) const noexcept;
		[[nodiscard]] const SkillGemInstance* GetGem(std::size_t a_index) const noexcept;
		[[nodiscard]] SkillGemInstance* GetGem(std::size_t a_index) noexcept;
		[[nodiscard]] std::vector<SocketColor> GetLayout() const;

		OperationResult SocketGem(std::size_t a_index, SkillGemInstance&& a_gem);
		std::optional<SkillGemInstance> UnsocketGem(std::size_t a_index) noexcept;

		OperationResult AddLink(std::size_t a_lhs, std::size_t a_rhs);
		OperationResult RemoveLink(std::size_t a_lhs, std::size_t a_rhs);
		[[nodiscard]] bool IsLinked(std::size_t a_lhs, std::size_t a_rhs) const noexcept;
		[[nodiscard]] std::span<const std::size_t> GetLinkedSockets(std::size_t a_index) const noexcept;
		[[nodiscard]] const std::vector<SocketLink>& GetLinks() const noexcept { return _links; }

	private:
		std::vector<Socket> _sockets{};
		std::vector<SocketLink> _links{};
	};
}
