#pragma once
#include "engine/raster_engine.h"
#include "render/map_renderer.h"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <unordered_set>
#include <vector>
#include <atomic>
#include <exception>

namespace rastile {

/* Background workers for engine tile calls.
   The owning thread submits jobs and drains results from its event loop.
   Workers only call RasterEngine::render(); they never touch the layer
   registry or the cache. */
class TileFetcher {
public:
    struct Result {
        RequestId id = 0;
        std::vector<uint8_t> data;
        std::exception_ptr error;
    };

    explicit TileFetcher(RasterEngine& engine);
    ~TileFetcher();

    /* Launch worker threads (at least one) */
    void start(int threads = 1);
    /* Signal workers to stop and join. Queued jobs are dropped. */
    void stop();
    bool running() const { return m_running.load(); }

    /* Enqueue an engine call (thread-safe, non-blocking) */
    void submit(RequestId id, EngineRequest req);

    /* Drop a queued job, or mark an in-flight one so its result is discarded.
       Returns false if the id is unknown (already completed or never submitted). */
    bool cancel(RequestId id);

    /* Dequeue one completed result. Returns true if a result was available. */
    bool poll_result(Result& out);

    /* Jobs queued or running */
    int pending() const;

    TileFetcher(const TileFetcher&) = delete;
    TileFetcher& operator=(const TileFetcher&) = delete;

private:
    RasterEngine& m_engine;
    std::vector<std::thread> m_threads;
    std::atomic<bool> m_running{false};

    struct Job {
        RequestId id = 0;
        EngineRequest req;
    };

    mutable std::mutex m_req_mutex;
    std::condition_variable m_req_cv;
    std::deque<Job> m_jobs;
    std::unordered_set<RequestId> m_in_flight;
    std::unordered_set<RequestId> m_cancelled;

    std::mutex m_result_mutex;
    std::deque<Result> m_results;

    void worker_loop();
};

} // namespace rastile
