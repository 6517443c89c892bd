//
// Created by LYS on 9/22/2026.
//

#pragma once

#include <Util/Assertions.hxx>
#include <Util/IndexRange.hxx>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

/// Thrown when a block would overlap an existing one or run past the logical length
class CBlockOverlapError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

template <typename Ty>
struct SSparseBlock {
    std::size_t Offset = 0;
    std::vector<Ty> Data;

    [[nodiscard]] std::size_t End() const noexcept { return Offset + Data.size(); }
};

/**
 * Walks a sub-range of a CSparseVector one index at a time.
 *
 * Dereferencing yields a pointer to the element at the current index, or nullptr when
 * the index falls in a gap. Compares equal to std::default_sentinel once the end of
 * the requested range is reached.
 */
template <typename Ty>
class CSparseIterator {
public:
    using value_type = const Ty*;
    using difference_type = std::ptrdiff_t;
    using iterator_concept = std::forward_iterator_tag;
    using iterator_category = std::input_iterator_tag;

    CSparseIterator() = default;
    CSparseIterator(const std::vector<SSparseBlock<Ty>>* Blocks, std::size_t BlockIndex, std::size_t Position, std::size_t End) noexcept
        : m_Blocks(Blocks)
        , m_BlockIndex(BlockIndex)
        , m_Position(Position)
        , m_End(End)
    {
        SkipPassedBlocks();
    }

    [[nodiscard]] const Ty* operator*() const
    {
        LV_CHECK(m_Blocks != nullptr, "Dereferencing a detached sparse iterator")
        LV_CHECK(m_Position < m_End, "Dereferencing a sparse iterator past its end")

        if (m_BlockIndex < m_Blocks->size()) {
            const auto& Block = (*m_Blocks)[m_BlockIndex];
            if (m_Position >= Block.Offset)
                return &Block.Data[m_Position - Block.Offset];
        }

        /// In a gap before the next block, or after the last one
        return nullptr;
    }

    CSparseIterator& operator++() noexcept
    {
        ++m_Position;
        SkipPassedBlocks();
        return *this;
    }

    CSparseIterator operator++(int) noexcept
    {
        auto Result = *this;
        ++*this;
        return Result;
    }

    [[nodiscard]] std::size_t GetPosition() const noexcept { return m_Position; }

    [[nodiscard]] bool operator==(const CSparseIterator& Other) const noexcept { return m_Position == Other.m_Position; }
    [[nodiscard]] bool operator==(std::default_sentinel_t) const noexcept { return m_Position >= m_End; }

private:
    /// Blocks ending at or before the current position are done, empty ones included
    void SkipPassedBlocks() noexcept
    {
        while (m_BlockIndex < m_Blocks->size() && (*m_Blocks)[m_BlockIndex].End() <= m_Position)
            ++m_BlockIndex;
    }

    const std::vector<SSparseBlock<Ty>>* m_Blocks = nullptr;
    std::size_t m_BlockIndex = 0;
    std::size_t m_Position = 0;
    std::size_t m_End = 0;
};

template <typename Ty>
class CSparseRange {
public:
    CSparseRange(CSparseIterator<Ty> Begin, const std::size_t Size) noexcept
        : m_Begin(Begin)
        , m_Size(Size)
    {
    }

    [[nodiscard]] CSparseIterator<Ty> begin() const noexcept { return m_Begin; }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return std::default_sentinel; }
    [[nodiscard]] std::size_t size() const noexcept { return m_Size; }

private:
    CSparseIterator<Ty> m_Begin;
    std::size_t m_Size;
};

/**
 * Fixed-length sequence where only some contiguous blocks are populated.
 *
 * Blocks are kept sorted by offset and never overlap; touching blocks stay separate.
 * Gaps are never stored, iteration reports them as nullptr.
 */
template <typename Ty>
class CSparseVector {
    explicit CSparseVector(const std::size_t Length)
        : m_Length(Length)
    {
    }

public:
    static CSparseVector WithLength(const std::size_t Length)
    {
        return CSparseVector { Length };
    }

    static CSparseVector FromFull(std::vector<Ty> Data)
    {
        CSparseVector Result { Data.size() };
        if (!Data.empty())
            Result.m_Blocks.push_back(SSparseBlock<Ty> { 0, std::move(Data) });
        return Result;
    }

    [[nodiscard]] std::size_t GetLength() const noexcept { return m_Length; }
    [[nodiscard]] std::size_t GetBlockCount() const noexcept { return m_Blocks.size(); }
    [[nodiscard]] const auto& GetBlocks() const noexcept { return m_Blocks; }

    /**
     *
     * Insert data into empty space
     *
     * @param Start Logical index of the first element
     * @param Data Elements to place at [Start, Start + Data.size())
     * @throw CBlockOverlapError if the space is occupied or out of bound, the container is left untouched
     */
    void Insert(const std::size_t Start, std::vector<Ty> Data)
    {
        LV_MAKE_SURE_AS(Start <= m_Length && Data.size() <= m_Length - Start, CBlockOverlapError,
            "Inserted block [" + std::to_string(Start) + ", +" + std::to_string(Data.size()) + ") exceeds length " + std::to_string(m_Length))

        /// Nothing to occupy
        if (Data.empty())
            return;

        const auto InsertIt = std::ranges::partition_point(m_Blocks, [Start](const SSparseBlock<Ty>& Block) { return Block.Offset < Start; });

        LV_MAKE_SURE_AS(InsertIt == m_Blocks.begin() || std::prev(InsertIt)->End() <= Start, CBlockOverlapError,
            "Inserted block at " + std::to_string(Start) + " overlaps existing block")
        LV_MAKE_SURE_AS(InsertIt == m_Blocks.end() || Start + Data.size() <= InsertIt->Offset, CBlockOverlapError,
            "Inserted block at " + std::to_string(Start) + " overlaps existing block")

        m_Blocks.insert(InsertIt, SSparseBlock<Ty> { Start, std::move(Data) });
    }

    /// nullptr if Index is in a gap or out of bound
    [[nodiscard]] const Ty* At(const std::size_t Index) const noexcept
    {
        const auto It = FirstBlockEndingAfter(Index);
        if (It == m_Blocks.end() || It->Offset > Index)
            return nullptr;

        return &It->Data[Index - It->Offset];
    }

    /// True when no index of Range falls in a gap
    [[nodiscard]] bool IsPopulated(const SIndexRange& Range) const noexcept
    {
        auto Position = Range.Start;
        for (auto It = FirstBlockEndingAfter(Range.Start); It != m_Blocks.end() && Position < Range.End; ++It) {
            if (It->Offset > Position)
                return false;
            Position = It->End();
        }

        return Position >= Range.End;
    }

    [[nodiscard]] CSparseRange<Ty> Iter() const noexcept
    {
        return { CSparseIterator<Ty> { &m_Blocks, 0, 0, m_Length }, m_Length };
    }

    /// Behave exactly as Iter() skipping Range.Start elements and taking Range.Size() of them
    [[nodiscard]] CSparseRange<Ty> IterRange(const SIndexRange& Range) const
    {
        LV_MAKE_SURE(Range.Start <= Range.End && Range.End <= m_Length,
            "Iterating [" + std::to_string(Range.Start) + ", " + std::to_string(Range.End) + ") out of length " + std::to_string(m_Length))

        // Discard blocks that come before the start
        const auto BlockIndex = static_cast<std::size_t>(std::distance(m_Blocks.begin(), FirstBlockEndingAfter(Range.Start)));
        return { CSparseIterator<Ty> { &m_Blocks, BlockIndex, Range.Start, Range.End }, Range.Size() };
    }

private:
    [[nodiscard]] auto FirstBlockEndingAfter(const std::size_t Index) const noexcept
    {
        return std::ranges::partition_point(m_Blocks, [Index](const SSparseBlock<Ty>& Block) { return Block.End() <= Index; });
    }

    std::size_t m_Length;

    /// Sorted by Offset, each block starts from an offset within the length and proceeds to the end of its Data
    std::vector<SSparseBlock<Ty>> m_Blocks;
};
