#pragma once

#include "GemLink/StatKey.h"

#include <array>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <utility>

namespace GemLink
{
	// Fixed-size stat map keyed by StatKey. Iteration follows StatKey declaration order.
	class StatBlock
	{
	public:
		constexpr StatBlock() noexcept = default;

		constexpr StatBlock(std::initializer_list<std::pair<StatKey, double>> a_values) noexcept
		{
			for (const auto& [key, value] : a_values) {
				Set(key, value);
			}
		}

		[[nodiscard]] constexpr bool Has(StatKey a_key) const noexcept
		{
			return a_key < StatKey::kTotal && _present[StatIndex(a_key)];
		}

		[[nodiscard]] constexpr std::optional<double> Get(StatKey a_key) const noexcept
		{
			if (!Has(a_key)) {
				return std::nullopt;
			}
			return _values[StatIndex(a_key)];
		}

		[[nodiscard]] constexpr double GetOr(StatKey a_key, double a_fallback) const noexcept
		{
			return Has(a_key) ? _values[StatIndex(a_key)] : a_fallback;
		}

		constexpr void Set(StatKey a_key, double a_value) noexcept
		{
			if (a_key >= StatKey::kTotal) {
				return;
			}
			_values[StatIndex(a_key)] = a_value;
			_present[StatIndex(a_key)] = true;
		}

		constexpr void Erase(StatKey a_key) noexcept
		{
			if (a_key >= StatKey::kTotal) {
				return;
			}
			_values[StatIndex(a_key)] = 0.0;
			_present[StatIndex(a_key)] = false;
		}

		[[nodiscard]] constexpr std::size_t Size() const noexcept
		{
			std::size_t count = 0;
			for (const bool present : _present) {
				if (present) {
					++count;
				}
			}
			return count;
		}

		[[nodiscard]] constexpr bool Empty() const noexcept { return Size() == 0; }

		template <class Fn>
		constexpr void ForEach(Fn&& a_fn) const
		{
			for (std::size_t i = 0; i < kStatKeyCount; ++i) {
				if (_present[i]) {
					a_fn(static_cast<StatKey>(i), _values[i]);
				}
			}
		}

		[[nodiscard]] constexpr bool operator==(const StatBlock& a_rhs) const noexcept
		{
			for (std::size_t i = 0; i < kStatKeyCount; ++i) {
				if (_present[i] != a_rhs._present[i]) {
					return false;
				}
				if (_present[i] && _values[i] != a_rhs._values[i]) {
					return false;
				}
			}
			return true;
		}

	private:
		std::array<double, kStatKeyCount> _values{};
		std::array<bool, kStatKeyCount> _present{};
	};
}
