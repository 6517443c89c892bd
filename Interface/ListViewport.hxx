//
// Created by LYS on 9/27/2026.
//

#pragma once

#include <Util/IndexRange.hxx>

#include <cstddef>

#include <glm/vec2.hpp>

/**
 * Pixel geometry of a vertically scrolling list with fixed height rows.
 *
 * Only the y component of the scroll offset is used, it is kept within
 * [0, content height - viewport height].
 */
class CListViewport {
public:
    CListViewport(float RowHeight, const glm::vec2& ViewportSize, std::size_t RowCount = 0);

    void Resize(const glm::vec2& ViewportSize);
    void SetRowCount(std::size_t RowCount);

    /// Positive delta scrolls down
    void Scroll(float Delta);
    void ScrollToRow(std::size_t Row);

    /// Rows intersecting the viewport, partially visible ones included
    [[nodiscard]] SIndexRange GetVisibleRange() const noexcept;

    [[nodiscard]] float GetMaxScroll() const noexcept;
    [[nodiscard]] float GetRowHeight() const noexcept { return m_RowHeight; }
    [[nodiscard]] std::size_t GetRowCount() const noexcept { return m_RowCount; }
    [[nodiscard]] const glm::vec2& GetViewportSize() const noexcept { return m_ViewportSize; }
    [[nodiscard]] const glm::vec2& GetScrollOffset() const noexcept { return m_ScrollOffset; }

protected:
    void ClampScroll() noexcept;

    float m_RowHeight;
    std::size_t m_RowCount;

    glm::vec2 m_ViewportSize;
    glm::vec2 m_ScrollOffset { 0, 0 };
};
