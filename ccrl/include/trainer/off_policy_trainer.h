#ifndef CCRL_OFF_POLICY_TRAINER_H
#define CCRL_OFF_POLICY_TRAINER_H


#include <utility>
#include <functional>
#include <optional>

#include "agent/off_policy_agent.h"
#include "trainer/tester.h"
#include "logger.h"
#include "gym_cpp/gym.h"
#include "utils/stop_watcher.h"
#include "nlohmann/json.hpp"

namespace ccrl::trainer {

    struct TrainerConfig {
        int64_t epochs = 100;
        int64_t steps_per_epoch = 4000;
        // uniform random actions before this many env steps
        int64_t start_steps = 0;
        int64_t update_after = 1000;
        int64_t update_every = 50;
        int64_t update_per_step = 1;
        int64_t num_test_episodes = 10;
        int64_t seed = 1;
        // checkpoint every save_freq epochs when a checkpoint dir is set
        int64_t save_freq = 10;
        std::optional<std::string> checkpoint_dir;
        // try to restore the agent from checkpoint_dir before training
        bool load_checkpoint = false;
    };

    void to_json(nlohmann::json &j, const TrainerConfig &config);

    class OffPolicyTrainer {
    public:
        explicit OffPolicyTrainer(const std::function<std::shared_ptr<gym::env::Env>()> &env_fn,
                                  const std::function<std::shared_ptr<agent::OffPolicyAgent>()> &agent_fn,
                                  const TrainerConfig &config,
                                  torch::Device device = torch::kCPU);

        virtual ~OffPolicyTrainer();

        // experiment name defaults to <env>_<algorithm>
        void setup_logger(std::optional<std::string> exp_name, const std::string &data_dir,
                          const nlohmann::json &extra_config = {});

        virtual void train();

        [[nodiscard]] std::shared_ptr<agent::OffPolicyAgent> get_agent() const;

        [[nodiscard]] std::shared_ptr<logger::EpochLogger> get_logger() const;

        [[nodiscard]] int64_t get_total_steps() const;

    protected:
        const std::shared_ptr<gym::env::Env> env;
        const std::shared_ptr<gym::env::Env> test_env;
        const std::shared_ptr<agent::OffPolicyAgent> agent;
        std::shared_ptr<logger::EpochLogger> logger;
        std::unique_ptr<Tester> tester;
        const TrainerConfig config;
        const torch::Device device;
        const torch::Device cpu = torch::kCPU;
        watcher::StopWatcher watcher;

        int64_t total_steps{};
        float episode_rewards{};
        int64_t episode_length{};
        gym::env::State s;

    private:
        void train_step();

        void maybe_save(int64_t epoch);

        void reset();
    };
}

#endif //CCRL_OFF_POLICY_TRAINER_H
