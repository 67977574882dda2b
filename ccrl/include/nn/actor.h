#ifndef CCRL_ACTOR_H
#define CCRL_ACTOR_H

#include <torch/torch.h>
#include <utility>
#include "nn/functional.h"

namespace ccrl::nn {

    /*
     * Deterministic policy. The tanh output in (-1, 1) is mapped affinely onto [low, high].
     */
    class DeterministicActorImpl : public torch::nn::Module {
    public:
        explicit DeterministicActorImpl(int64_t obs_dim, const torch::Tensor &act_low, const torch::Tensor &act_high,
                                        int64_t mlp_hidden, int64_t num_layers = 3);

        torch::Tensor forward(const torch::Tensor &obs);

    private:
        StackSequential model{nullptr};
        torch::Tensor action_scale;
        torch::Tensor action_bias;
    };

    TORCH_MODULE(DeterministicActor);

    /*
     * Diagonal Gaussian policy head. forward returns (mean, std) of the pre-squash distribution.
     * Sampling and the tanh change of variables live in functional::squashed_gaussian_sample.
     */
    class GaussianActorImpl : public torch::nn::Module {
    public:
        static constexpr float LOG_STD_MIN = -20.f;
        static constexpr float LOG_STD_MAX = 2.f;

        explicit GaussianActorImpl(int64_t obs_dim, int64_t act_dim, int64_t mlp_hidden, int64_t num_layers = 3);

        std::pair<torch::Tensor, torch::Tensor> forward(const torch::Tensor &obs);

    private:
        StackSequential trunk{nullptr};
        torch::nn::Linear mu_head{nullptr};
        torch::nn::Linear log_std_head{nullptr};
    };

    TORCH_MODULE(GaussianActor);
}

#endif //CCRL_ACTOR_H
