//
// Created by LYS on 9/22/2026.
//

#pragma once

#include "IndexRange.hxx"

#include <cstddef>
#include <map>

class CIndexRangeSet {
public:
    // O(log N) - Merges with every overlapping or touching range
    void Insert(const SIndexRange& Range);

    // O(log N + K) - K being the number of ranges touched, may split one range in two
    void Erase(const SIndexRange& Range);

    // O(log N)
    [[nodiscard]] bool Contains(std::size_t Index) const noexcept;

    // O(log N)
    [[nodiscard]] bool Intersects(const SIndexRange& Range) const noexcept;

    /// True if every index of Range is inside a single stored range, empty ranges are always covered
    [[nodiscard]] bool Covers(const SIndexRange& Range) const noexcept;

    [[nodiscard]] bool Empty() const noexcept { return m_Ranges.empty(); }
    [[nodiscard]] auto GetRangeCount() const noexcept { return m_Ranges.size(); }

    void Clear() noexcept { m_Ranges.clear(); }

    template <typename Self>
    [[nodiscard]] decltype(auto) begin(this Self&& s) noexcept { return s.m_Ranges.begin(); }
    template <typename Self>
    [[nodiscard]] decltype(auto) end(this Self&& s) noexcept { return s.m_Ranges.end(); }

private:
    // Map stores <Start, End>, half-open
    // Invariant: Ranges are disjoint and non-adjacent (e.g., [1,3) and [3,5) would be merged to [1,5))
    std::map<std::size_t, std::size_t> m_Ranges;
};
