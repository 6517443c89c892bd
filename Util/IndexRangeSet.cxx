//
// Created by LYS on 9/22/2026.
//

#include "IndexRangeSet.hxx"

#include <algorithm>
#include <iterator>

void CIndexRangeSet::Insert(const SIndexRange& Range)
{
    if (Range.Empty())
        return;

    auto Left = Range.Start;
    auto Right = Range.End;

    // 1. Step back to the range starting at or before Left, it may overlap or touch us
    auto It = m_Ranges.upper_bound(Left);
    if (It != m_Ranges.begin()) {
        const auto Prev = std::prev(It);
        if (Prev->second >= Left) {
            Left = Prev->first;
            Right = std::max(Right, Prev->second);
            It = m_Ranges.erase(Prev);
        }
    }

    // 2. Swallow every following range that starts inside (or right at the end of) [Left, Right)
    while (It != m_Ranges.end() && It->first <= Right) {
        Right = std::max(Right, It->second);
        It = m_Ranges.erase(It);
    }

    m_Ranges.emplace_hint(It, Left, Right);
}

void CIndexRangeSet::Erase(const SIndexRange& Range)
{
    if (Range.Empty())
        return;

    // The first range that might intersect is the one starting at or before Range.Start
    auto It = m_Ranges.upper_bound(Range.Start);
    if (It != m_Ranges.begin())
        --It;

    while (It != m_Ranges.end() && It->first < Range.End) {
        const auto CurrentStart = It->first;
        const auto CurrentEnd = It->second;

        if (CurrentEnd <= Range.Start) {
            ++It;
            continue;
        }

        It = m_Ranges.erase(It);

        // 1. Keep the left remainder
        if (CurrentStart < Range.Start) {
            m_Ranges.emplace_hint(It, CurrentStart, Range.Start);
        }

        // 2. Keep the right remainder, nothing after it can intersect
        if (CurrentEnd > Range.End) {
            m_Ranges.emplace_hint(It, Range.End, CurrentEnd);
            break;
        }
    }
}

bool CIndexRangeSet::Contains(const std::size_t Index) const noexcept
{
    auto It = m_Ranges.upper_bound(Index);
    if (It == m_Ranges.begin())
        return false;

    return Index < std::prev(It)->second;
}

bool CIndexRangeSet::Intersects(const SIndexRange& Range) const noexcept
{
    if (Range.Empty())
        return false;

    // Any range starting before Range.End is a candidate, only the last one of them can reach far enough
    auto It = m_Ranges.lower_bound(Range.End);
    if (It == m_Ranges.begin())
        return false;

    return std::prev(It)->second > Range.Start;
}

bool CIndexRangeSet::Covers(const SIndexRange& Range) const noexcept
{
    if (Range.Empty())
        return true;

    auto It = m_Ranges.upper_bound(Range.Start);
    if (It == m_Ranges.begin())
        return false;

    return std::prev(It)->second >= Range.End;
}
