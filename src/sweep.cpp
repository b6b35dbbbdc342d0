#include "sweep.hpp"
#include "backtester.hpp"
#include <algorithm>
#include <future>

namespace ensemble {

namespace {

SweepResult runOne(const RunConfig& cfg, const std::vector<MarketBar>& bars, const EngineFactory& factory) {
    SweepResult r;
    r.config = cfg;
    try {
        Backtester bt(factory(cfg), cfg, IndicatorParams{}, nullptr);
        if (!bt.runPrepared(bars)) {
            r.error = bt.error();
            return r;
        }
        r.ok = true;
        r.metrics = bt.analyze();
        r.steps = bt.stepsProcessed();
        r.stopped_early = bt.stoppedEarly();
        r.stop_reason = bt.stopReason();
    } catch (const std::exception& ex) {
        r.ok = false;
        r.error = ex.what();
    }
    return r;
}

} // namespace

std::vector<SweepResult> runSweep(const std::vector<RunConfig>& configs,
                                  const std::vector<MarketBar>& bars,
                                  const EngineFactory& factory,
                                  std::size_t max_threads) {
    std::vector<SweepResult> results(configs.size());
    const std::size_t batch = std::max<std::size_t>(1, max_threads);

    for (std::size_t start = 0; start < configs.size(); start += batch) {
        const std::size_t end = std::min(configs.size(), start + batch);
        std::vector<std::future<SweepResult>> futures;
        futures.reserve(end - start);
        for (std::size_t i = start; i < end; ++i)
            futures.push_back(std::async(std::launch::async, runOne, std::cref(configs[i]), std::cref(bars),
                                         std::cref(factory)));
        for (std::size_t i = start; i < end; ++i)
            results[i] = futures[i - start].get();
    }
    return results;
}

} // namespace ensemble
