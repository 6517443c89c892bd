//
// Created by LYS on 9/23/2026.
//

#pragma once

#include <LazyView/Container/SparseVector.hxx>

#include <Util/IndexRange.hxx>
#include <Util/IndexRangeSet.hxx>

#include <cstddef>
#include <optional>

/// How far past the view to load, as a fraction of the view size, in each direction
struct SPrefetchPolicy {
    std::size_t ExpandNumerator = 1;
    std::size_t ExpandDenominator = 2;
};

/**
 *
 * Expand the view by the policy margin on both sides, clamped to [0, Length)
 *
 * @param Length Logical length of the data
 * @param View Currently visible range
 * @param Policy Margin to add
 * @return The range worth having loaded, empty if View is empty
 */
SIndexRange GetShouldLoadRange(std::size_t Length, const SIndexRange& View, const SPrefetchPolicy& Policy = { });

/**
 * Tracks runs of missing indices over a left to right scan and keeps the longest one.
 * On equal length the first run found stays.
 */
class CGapScanner {
public:
    explicit CGapScanner(std::size_t ScanStart) noexcept;

    /// Feed the next index of the scan
    void Push(bool Missing) noexcept;

    /// Close any run still open at ScanEnd and return the longest run
    [[nodiscard]] std::optional<SIndexRange> Finish(std::size_t ScanEnd) noexcept;

private:
    void CloseRun(std::size_t RunEnd) noexcept;

    std::size_t m_Position;
    std::optional<std::size_t> m_CurrentStart;
    std::optional<SIndexRange> m_Longest;
};

namespace PlannerDetail {
/// Used by NextRequestForView only, kept out of line so the header does not pull in spdlog
void LogPlannedRequest(const SIndexRange& View, const SIndexRange& ShouldLoad, const std::optional<SIndexRange>& Result);
}

/**
 *
 * Call this on a change to the viewed data or when ready to make a request
 *
 * @param Data Records loaded so far
 * @param View Currently visible range
 * @param Policy How much to load around the view
 * @param Pending Ranges already requested but not yet inserted, counted as loaded, may be null
 * @return The longest missing range around the view, nullopt if nothing is missing
 */
template <typename Ty>
std::optional<SIndexRange> NextRequestForView(const CSparseVector<Ty>& Data, const SIndexRange& View, const SPrefetchPolicy& Policy = { }, const CIndexRangeSet* Pending = nullptr)
{
    if (View.Empty())
        return std::nullopt;

    const auto ShouldLoad = GetShouldLoadRange(Data.GetLength(), View, Policy);
    if (ShouldLoad.Empty())
        return std::nullopt;

    CGapScanner Scanner { ShouldLoad.Start };
    for (auto It = Data.IterRange(ShouldLoad).begin(); It != std::default_sentinel; ++It) {
        Scanner.Push(*It == nullptr && (Pending == nullptr || !Pending->Contains(It.GetPosition())));
    }

    auto Result = Scanner.Finish(ShouldLoad.End);
    PlannerDetail::LogPlannedRequest(View, ShouldLoad, Result);
    return Result;
}
