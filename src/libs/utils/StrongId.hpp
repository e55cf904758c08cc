// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QHash>
#include <QtCore/QtGlobal>

#include <atomic>
#include <compare>

namespace Utils {

// Typed integral id. Values come from a process-wide counter per tag, so an id
// is never handed out twice and 0 is reserved for the null id.
template <typename Tag>
class StrongId final {
public:
    using ValueType = quint64;

    constexpr StrongId() noexcept = default;

    static StrongId create() noexcept
    {
        static std::atomic<ValueType> counter{0};
        return StrongId(counter.fetch_add(1, std::memory_order_relaxed) + 1);
    }

    static constexpr StrongId null() noexcept { return StrongId{}; }
    static constexpr StrongId fromValue(ValueType value) noexcept { return StrongId(value); }

    constexpr bool isNull() const noexcept { return m_value == 0; }
    constexpr ValueType value() const noexcept { return m_value; }

    friend constexpr bool operator==(StrongId, StrongId) noexcept = default;
    friend constexpr auto operator<=>(StrongId, StrongId) noexcept = default;

    friend size_t qHash(StrongId id, size_t seed = 0) noexcept { return ::qHash(id.m_value, seed); }

private:
    constexpr explicit StrongId(ValueType value) noexcept
        : m_value(value)
    {}

    ValueType m_value = 0;
};

} // namespace Utils
