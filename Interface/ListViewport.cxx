//
// Created by LYS on 9/27/2026.
//

#include "ListViewport.hxx"

#include <Util/Assertions.hxx>

#include <glm/common.hpp>

#include <algorithm>
#include <cmath>

CListViewport::CListViewport(const float RowHeight, const glm::vec2& ViewportSize, const std::size_t RowCount)
    : m_RowHeight(RowHeight)
    , m_RowCount(RowCount)
    , m_ViewportSize(ViewportSize)
{
    LV_MAKE_SURE(m_RowHeight > 0, "Row height must be positive")
}

void CListViewport::Resize(const glm::vec2& ViewportSize)
{
    m_ViewportSize = glm::max(ViewportSize, glm::vec2 { 0, 0 });
    ClampScroll();
}

void CListViewport::SetRowCount(const std::size_t RowCount)
{
    m_RowCount = RowCount;
    ClampScroll();
}

void CListViewport::Scroll(const float Delta)
{
    m_ScrollOffset.y += Delta;
    ClampScroll();
}

void CListViewport::ScrollToRow(const std::size_t Row)
{
    m_ScrollOffset.y = static_cast<float>(Row) * m_RowHeight;
    ClampScroll();
}

SIndexRange CListViewport::GetVisibleRange() const noexcept
{
    if (m_RowCount == 0 || m_ViewportSize.y <= 0)
        return { };

    const auto First = static_cast<std::size_t>(std::floor(m_ScrollOffset.y / m_RowHeight));
    const auto Last = static_cast<std::size_t>(std::ceil((m_ScrollOffset.y + m_ViewportSize.y) / m_RowHeight));

    const auto End = std::min(Last, m_RowCount);
    return { std::min(First, End), End };
}

float CListViewport::GetMaxScroll() const noexcept
{
    return std::max(0.0f, static_cast<float>(m_RowCount) * m_RowHeight - m_ViewportSize.y);
}

void CListViewport::ClampScroll() noexcept
{
    m_ScrollOffset.x = 0;
    m_ScrollOffset.y = glm::clamp(m_ScrollOffset.y, 0.0f, GetMaxScroll());
}
