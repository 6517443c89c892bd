//
// Created by LYS on 9/23/2026.
//

#include "PrefetchPlanner.hxx"

#include <catch2/catch.hpp>

#include <limits>
#include <numeric>
#include <vector>

namespace {

std::vector<int> Iota(const int From, const int To)
{
    std::vector<int> Result(To - From);
    std::iota(Result.begin(), Result.end(), From);
    return Result;
}

using OptRange = std::optional<SIndexRange>;

}

TEST_CASE("No view request nothing")
{
    const auto Data = CSparseVector<int>::WithLength(20);
    CHECK(NextRequestForView(Data, { 0, 0 }) == std::nullopt);
    CHECK(NextRequestForView(Data, { 7, 7 }) == std::nullopt);
    CHECK(NextRequestForView(Data, { 9, 3 }) == std::nullopt);
}

TEST_CASE("Request extra half after")
{
    const auto Data = CSparseVector<int>::WithLength(20);
    CHECK(NextRequestForView(Data, { 0, 10 }) == OptRange { { 0, 15 } });
}

TEST_CASE("Request extra half before")
{
    const auto Data = CSparseVector<int>::WithLength(20);
    CHECK(NextRequestForView(Data, { 10, 20 }) == OptRange { { 5, 20 } });
}

TEST_CASE("Request half either side")
{
    const auto Data = CSparseVector<int>::WithLength(100);
    CHECK(NextRequestForView(Data, { 10, 20 }) == OptRange { { 5, 25 } });
}

TEST_CASE("Full view request all")
{
    const auto Data = CSparseVector<int>::WithLength(20);
    CHECK(NextRequestForView(Data, { 0, 20 }) == OptRange { { 0, 20 } });
}

TEST_CASE("Request half after")
{
    auto Data = CSparseVector<int>::WithLength(20);
    Data.Insert(0, Iota(0, 10));
    CHECK(NextRequestForView(Data, { 0, 10 }) == OptRange { { 10, 15 } });
}

TEST_CASE("Request half before")
{
    auto Data = CSparseVector<int>::WithLength(20);
    Data.Insert(10, Iota(10, 20));
    CHECK(NextRequestForView(Data, { 10, 20 }) == OptRange { { 5, 10 } });
}

TEST_CASE("Fully loaded requests nothing")
{
    const auto Data = CSparseVector<int>::FromFull(Iota(0, 20));
    CHECK(NextRequestForView(Data, { 0, 10 }) == std::nullopt);
    CHECK(NextRequestForView(Data, { 0, 20 }) == std::nullopt);
}

TEST_CASE("Longest gap wins")
{
    auto Data = CSparseVector<int>::WithLength(40);
    Data.Insert(12, Iota(12, 14));
    Data.Insert(16, Iota(16, 20));

    // Should load [10, 30), gaps are [10, 12) [14, 16) [20, 30)
    CHECK(NextRequestForView(Data, { 15, 25 }) == OptRange { { 20, 30 } });
}

TEST_CASE("First of equally long gaps wins")
{
    auto Data = CSparseVector<int>::WithLength(20);
    Data.Insert(3, Iota(3, 6));
    Data.Insert(9, Iota(9, 20));

    // Should load [0, 20), gaps are [0, 3) and [6, 9)
    CHECK(NextRequestForView(Data, { 5, 15 }) == OptRange { { 0, 3 } });
}

TEST_CASE("Filled gap is never reported again")
{
    auto Data = CSparseVector<int>::WithLength(100);
    const SIndexRange View { 10, 20 };

    auto Request = NextRequestForView(Data, View);
    REQUIRE(Request == OptRange { { 5, 25 } });

    /// Pretend the remote sent only part of it
    Data.Insert(5, Iota(5, 15));
    const auto Next = NextRequestForView(Data, View);
    CHECK(Next == OptRange { { 15, 25 } });

    Data.Insert(15, Iota(15, 25));
    CHECK(NextRequestForView(Data, View) == std::nullopt);
}

TEST_CASE("Pending ranges count as loaded")
{
    const auto Data = CSparseVector<int>::WithLength(20);
    CIndexRangeSet Pending;

    Pending.Insert({ 0, 5 });
    CHECK(NextRequestForView(Data, { 0, 10 }, { }, &Pending) == OptRange { { 5, 15 } });

    Pending.Insert({ 5, 15 });
    CHECK(NextRequestForView(Data, { 0, 10 }, { }, &Pending) == std::nullopt);

    Pending.Clear();
    Pending.Insert({ 3, 5 });
    CHECK(NextRequestForView(Data, { 0, 10 }, { }, &Pending) == OptRange { { 5, 15 } });
}

TEST_CASE("Expansion follows the policy")
{
    const auto Data = CSparseVector<int>::WithLength(100);

    CHECK(NextRequestForView(Data, { 10, 20 }, { 1, 1 }) == OptRange { { 0, 30 } });
    CHECK(NextRequestForView(Data, { 40, 50 }, { 0, 1 }) == OptRange { { 40, 50 } });
    CHECK(NextRequestForView(Data, { 40, 50 }, { 3, 2 }) == OptRange { { 25, 65 } });
    CHECK_THROWS_AS(NextRequestForView(Data, { 40, 50 }, { 1, 0 }), std::runtime_error);
}

TEST_CASE("Should load range clamps to bounds")
{
    CHECK(GetShouldLoadRange(20, { 0, 10 }) == SIndexRange { 0, 15 });
    CHECK(GetShouldLoadRange(20, { 10, 20 }) == SIndexRange { 5, 20 });
    CHECK(GetShouldLoadRange(20, { 0, 20 }) == SIndexRange { 0, 20 });
    CHECK(GetShouldLoadRange(20, { 3, 3 }).Empty());

    /// View running past the data is cut at the length
    CHECK(GetShouldLoadRange(20, { 15, 30 }) == SIndexRange { 8, 20 });
    CHECK(GetShouldLoadRange(20, { 40, 50 }).Empty());

    /// Odd sizes round the margin down
    CHECK(GetShouldLoadRange(100, { 50, 53 }) == SIndexRange { 49, 54 });
}

TEST_CASE("Should load range does not overflow")
{
    constexpr auto Max = std::numeric_limits<std::size_t>::max();

    CHECK(GetShouldLoadRange(Max, { Max - 10, Max }) == SIndexRange { Max - 15, Max });
    CHECK(GetShouldLoadRange(Max, { 0, Max }) == SIndexRange { 0, Max });

    const auto Data = CSparseVector<int>::WithLength(Max);
    CHECK(NextRequestForView(Data, { Max - 10, Max }) == OptRange { { Max - 15, Max } });
}

TEST_CASE("Gap scanner closes trailing run at the scan end")
{
    CGapScanner Scanner { 10 };
    for (const auto Missing : { false, true, true, false, true, true, true })
        Scanner.Push(Missing);

    CHECK(Scanner.Finish(17) == OptRange { { 14, 17 } });
}

TEST_CASE("Gap scanner without gaps")
{
    CGapScanner Scanner { 0 };
    for (int i = 0; i < 5; ++i)
        Scanner.Push(false);

    CHECK(Scanner.Finish(5) == std::nullopt);
}
