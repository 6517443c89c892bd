//
// Created by LYS on 9/21/2026.
//

#pragma once

#include <cstddef>

/// Half-open range of record indices [Start, End)
struct SIndexRange {
    std::size_t Start = 0;
    std::size_t End = 0;

    [[nodiscard]] constexpr std::size_t Size() const noexcept { return End > Start ? End - Start : 0; }
    [[nodiscard]] constexpr bool Empty() const noexcept { return End <= Start; }
    [[nodiscard]] constexpr bool Contains(const std::size_t Index) const noexcept { return Index >= Start && Index < End; }

    [[nodiscard]] constexpr bool operator==(const SIndexRange& Other) const noexcept = default;
};
