#ifndef CCRL_RL_FUNCTIONAL_H
#define CCRL_RL_FUNCTIONAL_H

#include <torch/torch.h>
#include <utility>

namespace ccrl::functional {
    // target <- source, parameter by parameter
    void hard_update(const torch::nn::Module &target, const torch::nn::Module &source);

    // target <- tau * source + (1 - tau) * target, parameter by parameter
    void soft_update(const torch::nn::Module &target, const torch::nn::Module &source, float tau);

    // added inside the log of the tanh correction so that saturated actions keep a finite density
    constexpr double TANH_LOG_PROB_EPSILON = 1e-6;

    // element-wise log density of N(mean, std) at x
    torch::Tensor normal_log_prob(const torch::Tensor &x, const torch::Tensor &mean, const torch::Tensor &std);

    /*
     * Reparameterized sample of a tanh squashed diagonal Gaussian mapped to [bias - scale, bias + scale].
     *
     *   x = mean + std * noise
     *   y = tanh(x)
     *   action = y * scale + bias
     *   log_prob = sum_d log N(x_d; mean_d, std_d) - log(scale_d * (1 - y_d^2) + eps)
     *
     * noise is a standard normal draw of the same shape as mean supplied by the caller, which keeps this function
     * deterministic. Gradients flow into mean and std. Returns (action, log_prob) with log_prob summed over the last
     * dimension.
     */
    std::pair<torch::Tensor, torch::Tensor> squashed_gaussian_sample(const torch::Tensor &mean,
                                                                     const torch::Tensor &std,
                                                                     const torch::Tensor &noise,
                                                                     const torch::Tensor &scale,
                                                                     const torch::Tensor &bias);
}


#endif //CCRL_RL_FUNCTIONAL_H
