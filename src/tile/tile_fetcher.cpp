#include "tile/tile_fetcher.h"
#include "util/log.h"
#include <algorithm>

namespace rastile {

TileFetcher::TileFetcher(RasterEngine& engine) : m_engine(engine) {}

TileFetcher::~TileFetcher() {
    stop();
}

void TileFetcher::start(int threads) {
    if (m_running.load()) return;
    m_running.store(true);
    int n = std::max(1, threads);
    for (int i = 0; i < n; i++) {
        m_threads.emplace_back(&TileFetcher::worker_loop, this);
    }
    LOG_INFO("TileFetcher: %d worker thread(s) started", n);
}

void TileFetcher::stop() {
    if (!m_running.load()) return;
    {
        /* Under the lock so a worker between its predicate check and wait sees it */
        std::lock_guard<std::mutex> lock(m_req_mutex);
        m_running.store(false);
    }
    m_req_cv.notify_all();
    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();

    {
        std::lock_guard<std::mutex> lock(m_req_mutex);
        m_jobs.clear();
        m_in_flight.clear();
        m_cancelled.clear();
    }
    {
        std::lock_guard<std::mutex> lock(m_result_mutex);
        m_results.clear();
    }
    LOG_INFO("TileFetcher: worker threads stopped");
}

void TileFetcher::submit(RequestId id, EngineRequest req) {
    std::lock_guard<std::mutex> lock(m_req_mutex);
    m_jobs.push_back({id, std::move(req)});
    m_req_cv.notify_one();
}

bool TileFetcher::cancel(RequestId id) {
    std::lock_guard<std::mutex> lock(m_req_mutex);
    auto it = std::find_if(m_jobs.begin(), m_jobs.end(),
                           [id](const Job& j) { return j.id == id; });
    if (it != m_jobs.end()) {
        m_jobs.erase(it);
        return true;
    }
    if (m_in_flight.count(id)) {
        m_cancelled.insert(id);
        return true;
    }
    return false;
}

bool TileFetcher::poll_result(Result& out) {
    std::lock_guard<std::mutex> lock(m_result_mutex);
    if (m_results.empty()) return false;
    out = std::move(m_results.front());
    m_results.pop_front();
    return true;
}

int TileFetcher::pending() const {
    std::lock_guard<std::mutex> lock(m_req_mutex);
    return static_cast<int>(m_jobs.size() + m_in_flight.size());
}

void TileFetcher::worker_loop() {
    while (m_running.load()) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(m_req_mutex);
            m_req_cv.wait(lock, [this] {
                return !m_jobs.empty() || !m_running.load();
            });
            if (!m_running.load()) break;
            if (m_jobs.empty()) continue;
            job = std::move(m_jobs.front());
            m_jobs.pop_front();
            m_in_flight.insert(job.id);
        }

        /* May block on network I/O. Failures travel with the result. */
        Result result;
        result.id = job.id;
        try {
            result.data = m_engine.render(job.req);
        } catch (const std::exception& e) {
            const TileCoord& c = request_coord(job.req);
            LOG_DEBUG("TileFetcher: %s failed for z=%d x=%d y=%d: %s",
                      command_name(job.req), c.z, c.x, c.y, e.what());
            result.error = std::current_exception();
        } catch (...) {
            result.error = std::current_exception();
        }

        bool cancelled;
        {
            std::lock_guard<std::mutex> lock(m_req_mutex);
            m_in_flight.erase(job.id);
            cancelled = m_cancelled.erase(job.id) > 0;
        }
        if (cancelled) continue;

        std::lock_guard<std::mutex> lock(m_result_mutex);
        m_results.push_back(std::move(result));
    }
}

} // namespace rastile
