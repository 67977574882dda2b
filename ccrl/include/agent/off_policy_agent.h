#ifndef CCRL_OFF_POLICY_AGENT_H
#define CCRL_OFF_POLICY_AGENT_H

#include <torch/torch.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "nlohmann/json.hpp"
#include "gym_cpp/spaces/space.h"
#include "logger.h"
#include "type.h"
#include "nn/value_net.h"
#include "replay_buffer/uniform_replay_buffer.h"

namespace ccrl::agent {

    // hyperparameters shared by every off-policy actor-critic agent
    struct OffPolicyConfig {
        int64_t mlp_hidden = 256;
        int64_t num_layers = 3;
        float policy_lr = 1e-3;
        float q_lr = 1e-3;
        float tau = 5e-3;
        float gamma = 0.99;
        int64_t batch_size = 100;
        int64_t replay_size = 1000000;
        // gradient norm clipping for the critic and actor updates
        std::optional<float> max_grad_norm;
    };

    void to_json(nlohmann::json &j, const OffPolicyConfig &config);

    /*
     * Off-policy actor-critic agent with twin critics and a target critic.
     *
     * The agent owns its replay buffer and all training state: online and target networks, optimizers and update
     * counters. Online parameters are only written by the update step; target parameters are only written by
     * functional::hard_update / functional::soft_update.
     */
    class OffPolicyAgent : public torch::nn::Module {
    public:
        explicit OffPolicyAgent(const std::string &name, const gym::space::Space &obs_space,
                                const gym::space::Space &act_space, const OffPolicyConfig &config);

        void update_target_q(bool soft);

        void set_logger(const std::shared_ptr<ccrl::logger::EpochLogger> &logger);

        virtual void log_tabular() = 0;

        void remember(const torch::Tensor &obs, const torch::Tensor &act, float rew, const torch::Tensor &next_obs,
                      bool done);

        // one update on a sampled batch. Returns false without touching anything if the buffer is too small.
        bool learn();

        [[nodiscard]] virtual int64_t min_replay_size() const = 0;

        virtual str_to_tensor train_step(const torch::Tensor &obs,
                                         const torch::Tensor &act,
                                         const torch::Tensor &next_obs,
                                         const torch::Tensor &rew,
                                         const torch::Tensor &done) = 0;

        virtual torch::Tensor act_single(const torch::Tensor &obs, bool exploration) = 0;

        // y = rew + gamma * (1 - done) * V(next_obs), without gradient
        virtual torch::Tensor compute_target_q(const torch::Tensor &next_obs,
                                               const torch::Tensor &rew,
                                               const torch::Tensor &done) = 0;

        // one critic step towards q_target. Returns the loss evaluated before the step.
        torch::Tensor update_q_net(const torch::Tensor &obs, const torch::Tensor &act, const torch::Tensor &q_target);

        // writes one file per tracked network into checkpoint_dir/name()
        void save_checkpoint(const std::string &checkpoint_dir);

        LoadResult load_checkpoint(const std::string &checkpoint_dir);

        [[nodiscard]] const replay_buffer::ReplayBuffer &get_buffer() const;

        [[nodiscard]] int64_t get_act_dim() const;

        [[nodiscard]] torch::Device device() const;

        [[nodiscard]] nn::EnsembleMinQNet get_q_network() const;

        [[nodiscard]] nn::EnsembleMinQNet get_target_q_network() const;

    protected:
        // file stem -> module
        [[nodiscard]] virtual std::map<std::string, std::shared_ptr<torch::nn::Module>> checkpoint_modules() const;

        // file stem -> tensor, loaded in place
        [[nodiscard]] virtual std::map<std::string, torch::Tensor> checkpoint_tensors() const;

        // called after a successful load
        virtual void post_load();

        void clip_grad(const std::vector<torch::Tensor> &parameters) const;

        const int64_t obs_dim;
        const int64_t act_dim;
        float tau;
        float gamma;
        int64_t batch_size;
        std::optional<float> max_grad_norm;
        torch::Tensor act_low;
        torch::Tensor act_high;
        nn::EnsembleMinQNet q_network{nullptr};
        nn::EnsembleMinQNet target_q_network{nullptr};
        std::unique_ptr<torch::optim::Optimizer> q_optimizer;
        std::unique_ptr<replay_buffer::ReplayBuffer> buffer;
        std::shared_ptr<ccrl::logger::EpochLogger> m_logger;
    };

    const gym::space::Box &as_box(const gym::space::Space &space);
}


#endif //CCRL_OFF_POLICY_AGENT_H
