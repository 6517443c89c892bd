//
// Created by LYS on 9/26/2026.
//

#include "ViewSession.hxx"

#include <Util/Assertions.hxx>
#include <Util/Logger.hxx>

#include <spdlog/spdlog.h>

CViewSessionBase::CViewSessionBase(SSessionConfig Config)
    : m_Config(std::move(Config))
    , m_Logger(GetOrCreateLogger("ViewSession"))
{
    LV_MAKE_SURE(m_Config.Prefetch.ExpandDenominator != 0, "Prefetch expand denominator must not be zero")
}

void CViewSessionBase::FailRequest(const SIndexRange& Request)
{
    m_Logger->warn("Request [{}, {}) failed", Request.Start, Request.End);

    if (m_Config.TrackPendingRequests) {
        LV_VERIFY(m_PendingRequests.Covers(Request))
        m_PendingRequests.Erase(Request);
    }
}

void CViewSessionBase::DispatchRequest(const std::optional<SIndexRange>& Request)
{
    if (!Request) {
        m_Logger->debug("View [{}, {}) needs nothing", m_View.Start, m_View.End);
        return;
    }

    m_Logger->debug("View [{}, {}) requests [{}, {})", m_View.Start, m_View.End, Request->Start, Request->End);

    if (m_Config.TrackPendingRequests)
        m_PendingRequests.Insert(*Request);

    // A callback may remove itself
    for (auto It = m_OnRequests.begin(); It != m_OnRequests.end();) {
        const auto Current = It++;
        (*Current)(*Request);
    }
}

void CViewSessionBase::ValidateCompletion(const SIndexRange& Request, const std::size_t RecordCount) const
{
    LV_MAKE_SURE(RecordCount <= Request.Size(),
        "Completed " + std::to_string(RecordCount) + " records for a request of " + std::to_string(Request.Size()))
}

void CViewSessionBase::FinishRequest(const SIndexRange& Request, const std::size_t RecordCount)
{
    if (m_Config.TrackPendingRequests) {
        LV_VERIFY(m_PendingRequests.Covers(Request))
        m_PendingRequests.Erase(Request);
    }

    if (RecordCount < Request.Size()) {
        m_Logger->warn("Request [{}, {}) completed with {} record(s) only", Request.Start, Request.End, RecordCount);
    } else {
        m_Logger->debug("Request [{}, {}) completed", Request.Start, Request.End);
    }
}
