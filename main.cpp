#include <Interface/ListViewport.hxx>

#include <LazyView/Session/SessionConfig.hxx>
#include <LazyView/Session/ViewSession.hxx>

#include <Util/Logger.hxx>

#include <algorithm>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

/// Stands in for a remote list, answers every fetch right away
class CSimulatedRemote {
public:
    CSimulatedRemote(std::size_t RowCount, unsigned Seed)
        : m_RowCount(RowCount)
        , m_Rng(Seed)
    {
    }

    std::vector<std::string> Fetch(const SIndexRange& Range)
    {
        std::vector<std::string> Records;

        /// Sometimes the remote runs short, the session has to cope with partial pages
        const auto Available = m_ShortPage(m_Rng) == 0 ? std::max<std::size_t>(1, Range.Size() / 2) : Range.Size();

        Records.reserve(Available);
        for (auto i = Range.Start; i < Range.Start + Available && i < m_RowCount; ++i)
            Records.emplace_back("Record #" + std::to_string(i));

        ++m_FetchCount;
        return Records;
    }

    [[nodiscard]] auto GetFetchCount() const noexcept { return m_FetchCount; }

private:
    std::size_t m_RowCount;
    std::size_t m_FetchCount = 0;

    std::mt19937 m_Rng;
    std::uniform_int_distribution<int> m_ShortPage { 0, 4 };
};

int main(int argc, char** argv)
{
    const std::filesystem::path ConfigPath = argc > 1 ? argv[1] : "LazyView.yaml";

    SSessionConfig Config;
    if (exists(ConfigPath)) {
        Config = SSessionConfig::LoadFrom(ConfigPath);
    } else {
        spdlog::warn("Config {} not found, using defaults", ConfigPath.string());
    }

    ApplyLogLevel(Config.LogLevel);

    CListViewport Viewport { Config.RowHeight, Config.ViewportSize, Config.RowCount };
    CViewSession<std::string> Session { Config.RowCount, Config };
    CSimulatedRemote Remote { Config.RowCount, 42 };

    std::vector<SIndexRange> Outstanding;
    Session.AddOnRequest([&](const SIndexRange& Request) {
        Outstanding.push_back(Request);
    });

    /// Scroll down past the end, then jump back to the middle
    std::vector<float> ScrollSteps(Config.RowCount / 10, Config.RowHeight * 7);
    ScrollSteps.push_back(-Viewport.GetMaxScroll() / 2);

    const auto Step = [&] {
        Session.SetView(Viewport.GetVisibleRange());

        /// Service every request, each completion may reveal more to load
        while (!Outstanding.empty()) {
            const auto Request = Outstanding.back();
            Outstanding.pop_back();

            auto Records = Remote.Fetch(Request);
            Session.CompleteRequest(Request, std::move(Records));

            /// Plan again only once nothing is in flight, an untracked session would request the same gap twice
            if (Outstanding.empty())
                Session.Refresh();
        }

        std::size_t Resident = 0;
        for (const auto* Record : Session.GetVisibleRecords())
            Resident += Record != nullptr;

        const auto& View = Session.GetView();
        spdlog::info("View [{}, {}) shows {}/{} record(s), {} block(s) loaded", View.Start, View.End, Resident, View.Size(), Session.GetData().GetBlockCount());
    };

    Step();
    for (const auto Delta : ScrollSteps) {
        Viewport.Scroll(Delta);
        Step();
    }

    if (const auto View = Session.GetView(); !View.Empty()) {
        if (const auto* First = Session.GetData().At(View.Start))
            spdlog::info("Top row: {}", *First);
    }

    spdlog::info("Done after {} fetch(es)", Remote.GetFetchCount());
    return 0;
}
