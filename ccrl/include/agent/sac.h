#ifndef CCRL_SAC_H
#define CCRL_SAC_H

#include "nn/actor.h"
#include "off_policy_agent.h"
#include <utility>

namespace ccrl::agent {

    struct SACConfig : public OffPolicyConfig {
        SACConfig() {
            policy_lr = 3e-4;
            q_lr = 3e-4;
            batch_size = 256;
            max_grad_norm = 1.0;
        }

        // initial entropy coefficient
        float alpha = 1.0;
        float alpha_lr = 1e-3;
        // defaults to -act_dim
        std::optional<float> target_entropy;
    };

    void to_json(nlohmann::json &j, const SACConfig &config);

    /*
     * Soft actor-critic with a tanh squashed Gaussian policy and automatic entropy tuning.
     * Only the critics have a target copy; the next action of the bootstrap target comes from the current policy.
     */
    class SACAgent : public OffPolicyAgent {
    public:
        explicit SACAgent(const gym::space::Space &obs_space,
                          const gym::space::Space &act_space,
                          const SACConfig &config = SACConfig());

        void log_tabular() override;

        str_to_tensor train_step(const torch::Tensor &obs, const torch::Tensor &act, const torch::Tensor &next_obs,
                                 const torch::Tensor &rew, const torch::Tensor &done) override;

        // stochastic action when exploring, the squashed mean otherwise
        torch::Tensor act_single(const torch::Tensor &obs, bool exploration) override;

        // reparameterized (action, log_prob) for a batch of observations
        std::pair<torch::Tensor, torch::Tensor> sample_action(const torch::Tensor &obs);

        torch::Tensor compute_target_q(const torch::Tensor &next_obs,
                                       const torch::Tensor &rew,
                                       const torch::Tensor &done) override;

        [[nodiscard]] int64_t min_replay_size() const override;

        [[nodiscard]] float get_alpha() const;

        [[nodiscard]] float get_target_entropy() const;

        [[nodiscard]] nn::GaussianActor get_policy_network() const;

    protected:
        [[nodiscard]] std::map<std::string, std::shared_ptr<torch::nn::Module>> checkpoint_modules() const override;

        [[nodiscard]] std::map<std::string, torch::Tensor> checkpoint_tensors() const override;

        void post_load() override;

    private:
        float target_entropy;
        nn::GaussianActor policy_net{nullptr};
        std::unique_ptr<torch::optim::Optimizer> policy_optimizer;
        torch::Tensor log_alpha;
        torch::Tensor alpha;
        std::unique_ptr<torch::optim::Optimizer> alpha_optimizer;
        torch::Tensor action_scale;
        torch::Tensor action_bias;

        // returns the detached (policy loss, log_prob of the freshly sampled actions)
        std::pair<torch::Tensor, torch::Tensor> update_actor(const torch::Tensor &obs);

        torch::Tensor update_alpha(const torch::Tensor &log_prob);

        // alpha = exp(log_alpha), in place so that the registered buffer stays the same tensor
        void refresh_alpha();
    };
}

#endif //CCRL_SAC_H
