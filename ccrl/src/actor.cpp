#include "nn/actor.h"

namespace ccrl::nn {
    DeterministicActorImpl::DeterministicActorImpl(int64_t obs_dim, const torch::Tensor &act_low,
                                                   const torch::Tensor &act_high, int64_t mlp_hidden,
                                                   int64_t num_layers) {
        int64_t act_dim = act_low.numel();
        model = register_module("model", build_mlp(obs_dim, act_dim, mlp_hidden, num_layers, "relu", false, "tanh"));
        action_scale = register_buffer("action_scale", ((act_high - act_low) / 2.).to(torch::kFloat32).flatten());
        action_bias = register_buffer("action_bias", ((act_high + act_low) / 2.).to(torch::kFloat32).flatten());
    }

    torch::Tensor DeterministicActorImpl::forward(const torch::Tensor &obs) {
        return model->forward(obs) * action_scale + action_bias;
    }

    GaussianActorImpl::GaussianActorImpl(int64_t obs_dim, int64_t act_dim, int64_t mlp_hidden, int64_t num_layers) {
        trunk = register_module("trunk", build_mlp(obs_dim, mlp_hidden, mlp_hidden, num_layers - 1, "relu", false,
                                                   "relu"));
        mu_head = register_module("mu_head", torch::nn::Linear(mlp_hidden, act_dim));
        log_std_head = register_module("log_std_head", torch::nn::Linear(mlp_hidden, act_dim));
    }

    std::pair<torch::Tensor, torch::Tensor> GaussianActorImpl::forward(const torch::Tensor &obs) {
        auto feature = trunk->forward(obs);
        auto mean = mu_head->forward(feature);
        auto log_std = torch::clamp(log_std_head->forward(feature), LOG_STD_MIN, LOG_STD_MAX);
        return std::make_pair(mean, torch::exp(log_std));
    }
}
