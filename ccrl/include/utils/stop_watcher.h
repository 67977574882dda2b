#ifndef CCRL_STOP_WATCHER_H
#define CCRL_STOP_WATCHER_H


#include <chrono>
#include <string>

namespace ccrl::watcher {
    class StopWatcher {
    public:
        explicit StopWatcher(std::string name);

        explicit StopWatcher();

        [[nodiscard]] std::string name() const;

        void reset();

        void start();

        // elapsed time since the last start(), replacing the accumulated value
        void lap();

        // add the time since the last start() to the accumulated value
        void stop();

        [[nodiscard]] int64_t nanoseconds() const;

        [[nodiscard]] double microseconds() const;

        [[nodiscard]] double milliseconds() const;

        [[nodiscard]] double seconds() const;


    private:
        int64_t m_elapsed;
        std::string m_name;
        std::chrono::steady_clock::time_point m_start_time;
    };

}


#endif //CCRL_STOP_WATCHER_H
