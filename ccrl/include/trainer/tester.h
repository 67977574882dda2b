#ifndef CCRL_TESTER_H
#define CCRL_TESTER_H

#include "agent/off_policy_agent.h"

#include <utility>
#include "gym_cpp/envs/env.h"
#include "logger.h"

namespace ccrl::trainer {
    /*
     * Runs evaluation episodes with exploration off and stores TestEpRet/TestEpLen.
     */
    class Tester {
    public:
        explicit Tester(std::shared_ptr<gym::env::Env> env,
                        std::shared_ptr<agent::OffPolicyAgent> test_actor,
                        std::shared_ptr<logger::EpochLogger> logger,
                        int64_t num_test_episodes);

        void log_tabular();

        void run();

    protected:
        void test_step();

    private:
        std::shared_ptr<logger::EpochLogger> m_logger;
        int64_t m_num_test_episodes;
        std::shared_ptr<gym::env::Env> m_test_env;
        std::shared_ptr<agent::OffPolicyAgent> m_test_actor;
    };
}


#endif //CCRL_TESTER_H
