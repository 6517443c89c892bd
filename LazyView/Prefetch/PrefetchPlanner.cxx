//
// Created by LYS on 9/23/2026.
//

#include "PrefetchPlanner.hxx"

#include <Util/Assertions.hxx>

#include <spdlog/spdlog.h>

#include <algorithm>

SIndexRange GetShouldLoadRange(const std::size_t Length, const SIndexRange& View, const SPrefetchPolicy& Policy)
{
    LV_MAKE_SURE(Policy.ExpandDenominator != 0, "Prefetch expand denominator must not be zero")

    if (View.Empty())
        return { };

    /// Split to avoid overflowing on huge views
    const auto ViewSize = View.Size();
    const auto Extra = ViewSize / Policy.ExpandDenominator * Policy.ExpandNumerator
        + ViewSize % Policy.ExpandDenominator * Policy.ExpandNumerator / Policy.ExpandDenominator;

    const auto Start = View.Start > Extra ? View.Start - Extra : 0;
    const auto RoomAfter = View.End < Length ? Length - View.End : 0;
    const auto End = Extra >= RoomAfter ? Length : View.End + Extra;

    return { std::min(Start, End), End };
}

CGapScanner::CGapScanner(const std::size_t ScanStart) noexcept
    : m_Position(ScanStart)
{
}

void CGapScanner::Push(const bool Missing) noexcept
{
    if (Missing) {
        if (!m_CurrentStart)
            m_CurrentStart = m_Position;
    } else if (m_CurrentStart) {
        CloseRun(m_Position);
    }

    ++m_Position;
}

std::optional<SIndexRange> CGapScanner::Finish(const std::size_t ScanEnd) noexcept
{
    if (m_CurrentStart)
        CloseRun(ScanEnd);

    return m_Longest;
}

void CGapScanner::CloseRun(const std::size_t RunEnd) noexcept
{
    const SIndexRange Run { *m_CurrentStart, RunEnd };
    m_CurrentStart.reset();

    // Strictly longer only, an equal run found later never replaces the earlier one
    if (!m_Longest || m_Longest->Size() < Run.Size())
        m_Longest = Run;
}

void PlannerDetail::LogPlannedRequest(const SIndexRange& View, const SIndexRange& ShouldLoad, const std::optional<SIndexRange>& Result)
{
    if (Result) {
        spdlog::trace("[PrefetchPlanner] View [{}, {}) should load [{}, {}), requesting [{}, {})", View.Start, View.End, ShouldLoad.Start, ShouldLoad.End, Result->Start, Result->End);
    } else {
        spdlog::trace("[PrefetchPlanner] View [{}, {}) should load [{}, {}), nothing missing", View.Start, View.End, ShouldLoad.Start, ShouldLoad.End);
    }
}
