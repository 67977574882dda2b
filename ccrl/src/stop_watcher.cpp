#include "utils/stop_watcher.h"

namespace ccrl::watcher {
    using clock = std::chrono::steady_clock;

    static int64_t elapsed_ns(const clock::time_point &since) {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - since).count();
    }

    StopWatcher::StopWatcher(std::string name) : m_elapsed(0), m_name(std::move(name)) {

    }

    StopWatcher::StopWatcher() : StopWatcher("default") {

    }

    std::string StopWatcher::name() const {
        return m_name;
    }

    void StopWatcher::reset() {
        m_elapsed = 0;
    }

    void StopWatcher::start() {
        m_start_time = clock::now();
    }

    void StopWatcher::lap() {
        m_elapsed = elapsed_ns(m_start_time);
    }

    void StopWatcher::stop() {
        m_elapsed += elapsed_ns(m_start_time);
    }

    int64_t StopWatcher::nanoseconds() const {
        return m_elapsed;
    }

    double StopWatcher::microseconds() const {
        return (double) nanoseconds() / 1e3;
    }

    double StopWatcher::milliseconds() const {
        return (double) nanoseconds() / 1e6;
    }

    double StopWatcher::seconds() const {
        return (double) nanoseconds() / 1e9;
    }

}
