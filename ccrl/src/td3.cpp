#include "agent/td3.h"
#include "utils/rl_functional.h"

namespace ccrl::agent {

    void to_json(nlohmann::json &j, const TD3Config &config) {
        to_json(j, static_cast<const OffPolicyConfig &>(config));
        j["update_actor_interval"] = config.update_actor_interval;
        j["warmup"] = config.warmup;
        j["actor_noise"] = config.actor_noise;
        j["target_noise"] = config.target_noise;
        j["noise_clip"] = config.noise_clip;
    }

    TD3Agent::TD3Agent(const gym::space::Space &obs_space,
                       const gym::space::Space &act_space,
                       const TD3Config &config) : OffPolicyAgent("td3", obs_space, act_space, config),
                                                  update_actor_interval(config.update_actor_interval),
                                                  warmup(config.warmup),
                                                  actor_noise(config.actor_noise),
                                                  target_noise(config.target_noise),
                                                  noise_clip(config.noise_clip) {
        if (update_actor_interval <= 0) {
            throw std::invalid_argument("update_actor_interval must be positive");
        }
        if (config.replay_size < 10 * config.batch_size) {
            throw std::invalid_argument(fmt::format("TD3 starts learning at 10 batches ({} transitions) but the "
                                                    "replay buffer only holds {}", 10 * config.batch_size,
                                                    config.replay_size));
        }
        this->policy_net = register_module("policy_network",
                                           nn::DeterministicActor(obs_dim, act_low, act_high, config.mlp_hidden,
                                                                  config.num_layers));
        this->target_policy_net = register_module("target_policy_network",
                                                  nn::DeterministicActor(obs_dim, act_low, act_high,
                                                                         config.mlp_hidden, config.num_layers));
        this->policy_optimizer = std::make_unique<torch::optim::Adam>(policy_net->parameters(),
                                                                      torch::optim::AdamOptions(config.policy_lr));

        this->update_target_policy(false);
    }

    void TD3Agent::update_target_policy(bool soft) {
        if (soft) {
            ccrl::functional::soft_update(*target_policy_net, *policy_net, tau);
        } else {
            ccrl::functional::hard_update(*target_policy_net, *policy_net);
        }
    }

    void TD3Agent::log_tabular() {
        for (int i = 0; i < 2; i++) {
            m_logger->log_tabular(fmt::format("Q{}Vals", i + 1), std::nullopt, true);
        }
        m_logger->log_tabular("LossPi", std::nullopt, false, true);
        m_logger->log_tabular("LossQ", std::nullopt, false, true);
    }

    str_to_tensor
    TD3Agent::train_step(const torch::Tensor &obs, const torch::Tensor &act, const torch::Tensor &next_obs,
                         const torch::Tensor &rew, const torch::Tensor &done) {
        auto q_target = this->compute_target_q(next_obs, rew, done);
        str_to_tensor info{{"LossQ", this->update_q_net(obs, act, q_target)}};
        learn_step_counter += 1;
        if (learn_step_counter % update_actor_interval == 0) {
            info["LossPi"] = this->update_actor(obs);
            this->update_target_q(true);
            this->update_target_policy(true);
        }
        return info;
    }

    torch::Tensor TD3Agent::clip_action(const torch::Tensor &action) const {
        return torch::max(torch::min(action, act_high), act_low);
    }

    torch::Tensor TD3Agent::act_single(const torch::Tensor &obs, bool exploration) {
        torch::NoGradGuard no_grad;
        torch::Tensor mu;
        if (exploration && time_step < warmup) {
            // pure exploration until the warmup budget is used up
            mu = torch::randn({act_dim}, act_low.options()) * this->actor_noise;
        } else {
            auto obs_batch = obs.to(device(), torch::kFloat32).unsqueeze(0);
            mu = this->policy_net->forward(obs_batch).index({0}); // (act_dim,)
        }
        mu = mu + torch::randn_like(mu) * this->actor_noise;
        time_step += 1;
        return clip_action(mu);
    }

    torch::Tensor
    TD3Agent::compute_target_q(const torch::Tensor &next_obs, const torch::Tensor &rew, const torch::Tensor &done) {
        torch::NoGradGuard no_grad;
        auto next_action = this->smoothed_target_action(next_obs);
        auto next_q_value = this->target_q_network->forward(next_obs, next_action, true);
        return rew + gamma * (1. - done) * next_q_value;
    }

    torch::Tensor TD3Agent::smoothed_target_action(const torch::Tensor &next_obs) {
        torch::NoGradGuard no_grad;
        torch::Tensor next_action = this->target_policy_net->forward(next_obs);
        if (this->target_noise > 0) {
            // one scalar draw shared by the whole batch
            auto epsilon = torch::randn({}, next_action.options()) * this->target_noise;
            epsilon = torch::clamp(epsilon, -this->noise_clip, this->noise_clip);
            next_action = clip_action(next_action + epsilon);
        }
        return next_action;
    }

    torch::Tensor TD3Agent::update_actor(const torch::Tensor &obs) {
        policy_optimizer->zero_grad();
        auto act = this->policy_net->forward(obs);
        // only the first critic drives the policy
        auto q = this->q_network->forward(obs, act, false).index({0});
        auto policy_loss = -torch::mean(q);
        policy_loss.backward();
        clip_grad(policy_net->parameters());
        policy_optimizer->step();
        if (m_logger) {
            m_logger->store("LossPi", policy_loss.item<float>());
        }
        return policy_loss.detach();
    }

    int64_t TD3Agent::min_replay_size() const {
        return 10 * batch_size;
    }

    int64_t TD3Agent::get_learn_step_counter() const {
        return learn_step_counter;
    }

    nn::DeterministicActor TD3Agent::get_policy_network() const {
        return policy_net;
    }

    nn::DeterministicActor TD3Agent::get_target_policy_network() const {
        return target_policy_net;
    }

    std::map<std::string, std::shared_ptr<torch::nn::Module>> TD3Agent::checkpoint_modules() const {
        auto modules = OffPolicyAgent::checkpoint_modules();
        modules["actor"] = policy_net.ptr();
        modules["target_actor"] = target_policy_net.ptr();
        return modules;
    }
}
