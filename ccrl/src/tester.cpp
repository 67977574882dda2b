#include "trainer/tester.h"
#include "spdlog/spdlog.h"

ccrl::trainer::Tester::Tester(std::shared_ptr<gym::env::Env> env, std::shared_ptr<agent::OffPolicyAgent> test_actor,
                              std::shared_ptr<logger::EpochLogger> logger, int64_t num_test_episodes) :
        m_logger(std::move(logger)),
        m_num_test_episodes(num_test_episodes),
        m_test_env(std::move(env)),
        m_test_actor(std::move(test_actor)) {

}

void ccrl::trainer::Tester::log_tabular() {
    if (m_num_test_episodes <= 0) return;
    m_logger->log_tabular("TestEpRet", std::nullopt, true);
    m_logger->log_tabular("TestEpLen", std::nullopt, false, true);
}

void ccrl::trainer::Tester::run() {
    spdlog::debug("Start testing");
    for (int64_t i = 0; i < m_num_test_episodes; ++i) {
        test_step();
    }
    spdlog::debug("Finish testing");
}

void ccrl::trainer::Tester::test_step() {
    gym::env::State test_s;
    m_test_env->reset(test_s);
    float test_episode_reward = 0;
    float test_episode_length = 0;
    while (true) {
        auto tensor_action = m_test_actor->act_single(test_s.observation, false).to(torch::kCPU);
        m_test_env->step(tensor_action, test_s);
        test_episode_reward += test_s.reward;
        test_episode_length += 1;
        if (test_s.done) break;
    }
    if (m_logger) {
        m_logger->store("TestEpRet", test_episode_reward);
        m_logger->store("TestEpLen", test_episode_length);
    }
}
