#include "GemLink/SocketGroup.h"

#include <algorithm>
#include <utility>

namespace GemLink
{
	bool Socket::IsLinkedTo(std::size_t a_index) const noexcept
	{
		return std::find(_links.begin(), _links.end(), a_index) != _links.end();
	}

	bool Socket::CanAccept(const SkillGemInstance& a_gem) const noexcept
	{
		return IsEmpty() && IsSocketColorCompatible(_color, a_gem.GetSocketColor());
	}

	OperationResult Socket::SocketGem(SkillGemInstance&& a_gem)
	{
		if (!CanAccept(a_gem)) {
			return OperationResult::Fail(IsEmpty() ? GemErrorCode::kSocketColorMismatch : GemErrorCode::kSocketOccupied);
		}

		_gem.emplace(std::move(a_gem));
		return OperationResult::Ok();
	}

	std::optional<SkillGemInstance> Socket::UnsocketGem() noexcept
	{
		std::optional<SkillGemInstance> out = std::move(_gem);
		_gem.reset();
		return out;
	}

	SocketGroup::SocketGroup(std::span<const SocketColor> a_layout)
	{
		_sockets.reserve(a_layout.size());
		for (const auto color : a_layout) {
			_sockets.emplace_back(color);
		}
	}

	std::size_t SocketGroup::AddSocket(SocketColor a_color)
	{
		_sockets.emplace_back(a_color);
		return _sockets.size() - 1;
	}

	const Socket* SocketGroup::GetSocket(std::size_t a_index) const noexcept
	{
		return IsValidIndex(a_index) ? std::addressof(_sockets[a_index]) : nullptr;
	}

	const SkillGemInstance* SocketGroup::GetGem(std::size_t a_index) const noexcept
	{
		return IsValidIndex(a_index) ? _sockets[a_index].Gem() : nullptr;
	}

	SkillGemInstance* SocketGroup::GetGem(std::size_t a_index) noexcept
	{
		return IsValidIndex(a_index) ? _sockets[a_index].Gem() : nullptr;
	}

	std::vector<SocketColor> SocketGroup::GetLayout() const
	{
		std::vector<SocketColor> layout;
		layout.reserve(_sockets.size());
		for (const auto& socket : _sockets) {
			layout.push_back(socket.Color());
		}
		return layout;
	}

	OperationResult SocketGroup::SocketGem(std::size_t a_index, SkillGemInstance&& a_gem)
	{
		if (!IsValidIndex(a_index)) {
			return OperationResult::Fail(GemErrorCode::kSocketIndexOutOfRange);
		}
		return _sockets[a_index].SocketGem(std::move(a_gem));
	}

	std::optional<SkillGemInstance> SocketGroup::UnsocketGem(std::size_t a_index) noexcept
	{
		if (!IsValidIndex(a_index)) {
			return std::nullopt;
		}
		return _sockets[a_index].UnsocketGem();
	}

	OperationResult SocketGroup::AddLink(std::size_t a_lhs, std::size_t a_rhs)
	{
		if (!IsValidIndex(a_lhs) || !IsValidIndex(a_rhs)) {
			return OperationResult::Fail(GemErrorCode::kSocketIndexOutOfRange);
		}
		if (a_lhs == a_rhs) {
			return OperationResult::Fail(GemErrorCode::kSelfLink);
		}
		if (IsLinked(a_lhs, a_rhs)) {
			return OperationResult::Ok();
		}

		_sockets[a_lhs]._links.push_back(a_rhs);
		_sockets[a_rhs]._links.push_back(a_lhs);
		_links.push_back(SocketLink{ .first = a_lhs, .second = a_rhs });
		return OperationResult::Ok();
	}

	OperationResult SocketGroup::RemoveLink(std::size_t a_lhs, std::size_t a_rhs)
	{
		if (!IsValidIndex(a_lhs) || !IsValidIndex(a_rhs)) {
			return OperationResult::Fail(GemErrorCode::kSocketIndexOutOfRange);
		}

		auto& lhsLinks = _sockets[a_lhs]._links;
		auto& rhsLinks = _sockets[a_rhs]._links;
		lhsLinks.erase(std::remove(lhsLinks.begin(), lhsLinks.end(), a_rhs), lhsLinks.end());
		rhsLinks.erase(std::remove(rhsLinks.begin(), rhsLinks.end(), a_lhs), rhsLinks.end());
		std::erase_if(_links, [&](const SocketLink& a_link) {
			return a_link.Connects(a_lhs, a_rhs);
		});
		return OperationResult::Ok();
	}

	bool SocketGroup::IsLinked(std::size_t a_lhs, std::size_t a_rhs) const noexcept
	{
		if (!IsValidIndex(a_lhs) || !IsValidIndex(a_rhs)) {
			return false;
		}
		return _sockets[a_lhs].IsLinkedTo(a_rhs);
	}

	std::span<const std::size_t> SocketGroup::GetLinkedSockets(std::size_t a_index) const noexcept
	{
		if (!IsValidIndex(a_index)) {
			return {};
		}
		return _sockets[a_index].LinkedSockets();
	}
}
