#ifndef CCRL_TD3_H
#define CCRL_TD3_H

#include "nn/actor.h"
#include "off_policy_agent.h"
#include <cmath>

namespace ccrl::agent {

    struct TD3Config : public OffPolicyConfig {
        // critic updates per actor update
        int64_t update_actor_interval = 2;
        // number of act_single calls that explore with pure noise
        int64_t warmup = 1000;
        float actor_noise = 0.1;
        float target_noise = 0.2;
        float noise_clip = 0.5;
    };

    void to_json(nlohmann::json &j, const TD3Config &config);

    class TD3Agent : public OffPolicyAgent {
    public:
        explicit TD3Agent(const gym::space::Space &obs_space,
                          const gym::space::Space &act_space,
                          const TD3Config &config = TD3Config());

        void update_target_policy(bool soft);

        void log_tabular() override;

        // updates the actor and both targets every update_actor_interval calls
        str_to_tensor train_step(const torch::Tensor &obs, const torch::Tensor &act, const torch::Tensor &next_obs,
                                 const torch::Tensor &rew, const torch::Tensor &done) override;

        torch::Tensor act_single(const torch::Tensor &obs, bool exploration) override;

        // target actor output plus clipped smoothing noise, clamped to the action bounds
        torch::Tensor smoothed_target_action(const torch::Tensor &next_obs);

        torch::Tensor compute_target_q(const torch::Tensor &next_obs,
                                       const torch::Tensor &rew,
                                       const torch::Tensor &done) override;

        [[nodiscard]] int64_t min_replay_size() const override;

        [[nodiscard]] int64_t get_learn_step_counter() const;

        [[nodiscard]] nn::DeterministicActor get_policy_network() const;

        [[nodiscard]] nn::DeterministicActor get_target_policy_network() const;

    protected:
        [[nodiscard]] std::map<std::string, std::shared_ptr<torch::nn::Module>> checkpoint_modules() const override;

    private:
        int64_t update_actor_interval;
        int64_t warmup;
        float actor_noise;
        float target_noise;
        float noise_clip;
        int64_t learn_step_counter{};
        int64_t time_step{};
        nn::DeterministicActor policy_net{nullptr};
        nn::DeterministicActor target_policy_net{nullptr};
        std::unique_ptr<torch::optim::Optimizer> policy_optimizer;

        torch::Tensor clip_action(const torch::Tensor &action) const;

        torch::Tensor update_actor(const torch::Tensor &obs);

    };

}
#endif //CCRL_TD3_H
