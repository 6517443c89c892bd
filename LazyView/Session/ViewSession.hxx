//
// Created by LYS on 9/26/2026.
//

#pragma once

#include "SessionConfig.hxx"

#include <LazyView/Container/SparseVector.hxx>
#include <LazyView/Prefetch/PrefetchPlanner.hxx>

#include <Util/IndexRangeSet.hxx>

#include <algorithm>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <vector>

namespace spdlog {
class logger;
}

/// Everything about a view session that does not depend on the record type
class CViewSessionBase {
public:
    using RequestCallback = std::function<void(const SIndexRange& Request)>;

    explicit CViewSessionBase(SSessionConfig Config);

    CViewSessionBase(const CViewSessionBase&) = delete;
    CViewSessionBase& operator=(const CViewSessionBase&) = delete;

    [[nodiscard]] const SSessionConfig& GetConfig() const noexcept { return m_Config; }
    [[nodiscard]] const SIndexRange& GetView() const noexcept { return m_View; }
    [[nodiscard]] const CIndexRangeSet& GetPendingRequests() const noexcept { return m_PendingRequests; }

    auto AddOnRequest(auto&& Callback) { return m_OnRequests.emplace(m_OnRequests.end(), std::forward<decltype(Callback)>(Callback)); }
    void RemoveOnRequest(const std::list<RequestCallback>::iterator& It) { m_OnRequests.erase(It); }

    /**
     *
     * Forget about a request that will never complete, the range may be planned again
     *
     * @param Request Range previously returned by SetView / Refresh
     */
    void FailRequest(const SIndexRange& Request);

protected:
    /// Record the planned request as pending and tell everyone who listens
    void DispatchRequest(const std::optional<SIndexRange>& Request);

    /// Throws when more records came back than were requested
    void ValidateCompletion(const SIndexRange& Request, std::size_t RecordCount) const;

    /// Stop tracking a request whose records are stored
    void FinishRequest(const SIndexRange& Request, std::size_t RecordCount);

    [[nodiscard]] const CIndexRangeSet* GetPlanningExclusions() const noexcept { return m_Config.TrackPendingRequests ? &m_PendingRequests : nullptr; }

    SSessionConfig m_Config;

    SIndexRange m_View { };
    CIndexRangeSet m_PendingRequests;

    std::list<RequestCallback> m_OnRequests;

    std::shared_ptr<spdlog::logger> m_Logger;
};

/**
 * Owns the records of a single virtualized view and decides what to fetch next.
 *
 * Drive it from one control flow: SetView on every view change, hand the fetched
 * records back with CompleteRequest (or FailRequest), read with GetVisibleRecords.
 */
template <typename Ty>
class CViewSession : public CViewSessionBase {
public:
    CViewSession(const std::size_t Length, SSessionConfig Config = { })
        : CViewSessionBase(std::move(Config))
        , m_Data(CSparseVector<Ty>::WithLength(Length))
    {
    }

    CViewSession(std::vector<Ty> FullData, SSessionConfig Config = { })
        : CViewSessionBase(std::move(Config))
        , m_Data(CSparseVector<Ty>::FromFull(std::move(FullData)))
    {
    }

    [[nodiscard]] const CSparseVector<Ty>& GetData() const noexcept { return m_Data; }

    /// Records of the current view, clamped to the data length
    [[nodiscard]] CSparseRange<Ty> GetVisibleRecords() const
    {
        const auto End = std::min(m_View.End, m_Data.GetLength());
        return m_Data.IterRange({ std::min(m_View.Start, End), End });
    }

    /// Store the new view and plan the next request for it
    std::optional<SIndexRange> SetView(const SIndexRange& View)
    {
        m_View = View;
        return Refresh();
    }

    /// Plan again for the current view, e.g. after a completion
    std::optional<SIndexRange> Refresh()
    {
        auto Request = NextRequestForView(m_Data, m_View, m_Config.Prefetch, GetPlanningExclusions());
        DispatchRequest(Request);
        return Request;
    }

    /**
     *
     * Insert the records fetched for a request
     *
     * @param Request Range previously returned by SetView / Refresh
     * @param Records Fetched records, may be fewer than requested when the remote ran short
     * @throw CBlockOverlapError if the records land on already loaded data, the request stays pending
     */
    void CompleteRequest(const SIndexRange& Request, std::vector<Ty> Records)
    {
        const auto RecordCount = Records.size();
        ValidateCompletion(Request, RecordCount);

        m_Data.Insert(Request.Start, std::move(Records));
        FinishRequest(Request, RecordCount);
    }

private:
    CSparseVector<Ty> m_Data;
};
