#include "agent/sac.h"
#include "utils/rl_functional.h"

#include <cmath>

namespace ccrl::agent {

    void to_json(nlohmann::json &j, const SACConfig &config) {
        to_json(j, static_cast<const OffPolicyConfig &>(config));
        j["alpha"] = config.alpha;
        j["alpha_lr"] = config.alpha_lr;
        if (config.target_entropy != std::nullopt) {
            j["target_entropy"] = config.target_entropy.value();
        } else {
            j["target_entropy"] = nullptr;
        }
    }

    SACAgent::SACAgent(const gym::space::Space &obs_space,
                       const gym::space::Space &act_space,
                       const SACConfig &config) : OffPolicyAgent("sac", obs_space, act_space, config) {
        if (config.alpha <= 0) {
            throw std::invalid_argument(fmt::format("Initial alpha must be positive. Got {}", config.alpha));
        }
        if (config.replay_size < config.batch_size) {
            throw std::invalid_argument(fmt::format("Batch size {} exceeds the replay buffer size {}",
                                                    config.batch_size, config.replay_size));
        }
        // heuristic -dim(A)
        target_entropy = config.target_entropy.value_or(-static_cast<float>(act_dim));

        policy_net = register_module("policy_network", nn::GaussianActor(obs_dim, act_dim, config.mlp_hidden,
                                                                         config.num_layers));
        policy_optimizer = std::make_unique<torch::optim::Adam>(policy_net->parameters(),
                                                                torch::optim::AdamOptions(config.policy_lr));

        log_alpha = register_parameter("log_alpha", torch::full({1}, std::log(config.alpha)));
        alpha = register_buffer("alpha", torch::exp(log_alpha.detach()));
        alpha_optimizer = std::make_unique<torch::optim::Adam>(std::vector<torch::Tensor>{log_alpha},
                                                               torch::optim::AdamOptions(config.alpha_lr));

        action_scale = register_buffer("action_scale", (act_high - act_low) / 2.);
        action_bias = register_buffer("action_bias", (act_high + act_low) / 2.);
    }

    void SACAgent::log_tabular() {
        for (int i = 0; i < 2; i++) {
            m_logger->log_tabular(fmt::format("Q{}Vals", i + 1), std::nullopt, true);
        }
        m_logger->log_tabular("LogPi", std::nullopt, false, true);
        m_logger->log_tabular("LossPi", std::nullopt, false, true);
        m_logger->log_tabular("LossQ", std::nullopt, false, true);
        m_logger->log_tabular("LossAlpha", std::nullopt, false, true);
        m_logger->log_tabular("Alpha", std::nullopt, false, true);
    }

    std::pair<torch::Tensor, torch::Tensor> SACAgent::sample_action(const torch::Tensor &obs) {
        auto [mean, stddev] = policy_net->forward(obs);
        auto noise = torch::randn_like(mean);
        return ccrl::functional::squashed_gaussian_sample(mean, stddev, noise, action_scale, action_bias);
    }

    torch::Tensor SACAgent::act_single(const torch::Tensor &obs, bool exploration) {
        torch::NoGradGuard no_grad;
        auto obs_batch = obs.to(device(), torch::kFloat32).unsqueeze(0);
        torch::Tensor action;
        if (exploration) {
            action = sample_action(obs_batch).first;
        } else {
            auto mean = policy_net->forward(obs_batch).first;
            action = torch::tanh(mean) * action_scale + action_bias;
        }
        return action.index({0});
    }

    torch::Tensor
    SACAgent::compute_target_q(const torch::Tensor &next_obs, const torch::Tensor &rew, const torch::Tensor &done) {
        torch::NoGradGuard no_grad;
        auto [next_action, next_log_prob] = this->sample_action(next_obs);
        auto next_q_value = this->target_q_network->forward(next_obs, next_action, true);
        // soft state value
        next_q_value = next_q_value - alpha * next_log_prob;
        return rew + gamma * (1. - done) * next_q_value;
    }

    std::pair<torch::Tensor, torch::Tensor> SACAgent::update_actor(const torch::Tensor &obs) {
        policy_optimizer->zero_grad();
        auto [act, log_prob] = this->sample_action(obs);
        auto q = this->q_network->forward(obs, act, true);
        auto policy_loss = torch::mean(alpha * log_prob - q);
        policy_loss.backward();
        clip_grad(policy_net->parameters());
        policy_optimizer->step();
        if (m_logger) {
            m_logger->store("LossPi", policy_loss.item<float>());
            m_logger->store("LogPi", ccrl::nn::convert_tensor_to_flat_vector<float>(log_prob.detach()));
        }
        return std::make_pair(policy_loss.detach(), log_prob.detach());
    }

    torch::Tensor SACAgent::update_alpha(const torch::Tensor &log_prob) {
        alpha_optimizer->zero_grad();
        auto alpha_loss = -torch::mean(log_alpha * (log_prob + target_entropy).detach());
        alpha_loss.backward();
        alpha_optimizer->step();
        refresh_alpha();
        if (m_logger) {
            m_logger->store("LossAlpha", alpha_loss.item<float>());
            m_logger->store("Alpha", alpha.item<float>());
        }
        return alpha_loss.detach();
    }

    str_to_tensor
    SACAgent::train_step(const torch::Tensor &obs, const torch::Tensor &act, const torch::Tensor &next_obs,
                         const torch::Tensor &rew, const torch::Tensor &done) {
        auto q_target = this->compute_target_q(next_obs, rew, done);
        str_to_tensor info{{"LossQ", this->update_q_net(obs, act, q_target)}};
        auto [policy_loss, log_prob] = this->update_actor(obs);
        info["LossPi"] = policy_loss;
        info["LogPi"] = log_prob;
        info["LossAlpha"] = this->update_alpha(log_prob);
        info["Alpha"] = alpha.clone();
        this->update_target_q(true);
        return info;
    }

    int64_t SACAgent::min_replay_size() const {
        return batch_size;
    }

    float SACAgent::get_alpha() const {
        return alpha.item<float>();
    }

    float SACAgent::get_target_entropy() const {
        return target_entropy;
    }

    nn::GaussianActor SACAgent::get_policy_network() const {
        return policy_net;
    }

    std::map<std::string, std::shared_ptr<torch::nn::Module>> SACAgent::checkpoint_modules() const {
        auto modules = OffPolicyAgent::checkpoint_modules();
        modules["actor"] = policy_net.ptr();
        return modules;
    }

    std::map<std::string, torch::Tensor> SACAgent::checkpoint_tensors() const {
        return {{"log_alpha", log_alpha}};
    }

    void SACAgent::post_load() {
        refresh_alpha();
    }

    void SACAgent::refresh_alpha() {
        torch::NoGradGuard no_grad;
        alpha.copy_(torch::exp(log_alpha));
    }
}
