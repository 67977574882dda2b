#include "utils/rl_functional.h"
#include "fmt/format.h"
#include <cmath>

namespace ccrl::functional {
    static void check_same_structure(const std::vector<torch::Tensor> &target_params,
                                     const std::vector<torch::Tensor> &source_params) {
        if (target_params.size() != source_params.size()) {
            throw std::invalid_argument(fmt::format("Target has {} parameters while source has {}",
                                                    target_params.size(), source_params.size()));
        }
    }

    void hard_update(const torch::nn::Module &target, const torch::nn::Module &source) {
        torch::NoGradGuard no_grad;
        auto target_params = target.parameters();
        auto source_params = source.parameters();
        check_same_structure(target_params, source_params);
        for (size_t i = 0; i < target_params.size(); i++) {
            auto &target_param = target_params[i];
            auto &param = source_params[i];
            auto device = target_param.device();
            target_param.data().copy_(param.data().to(device));
        }
    }

    void soft_update(const torch::nn::Module &target, const torch::nn::Module &source, float tau) {
        torch::NoGradGuard no_grad;
        auto target_params = target.parameters();
        auto source_params = source.parameters();
        check_same_structure(target_params, source_params);
        for (size_t i = 0; i < target_params.size(); i++) {
            auto &target_param = target_params[i];
            auto &param = source_params[i];
            target_param.data().copy_(target_param.data() * (1.0 - tau) + param.data() * tau);
        }
    }

    torch::Tensor normal_log_prob(const torch::Tensor &x, const torch::Tensor &mean, const torch::Tensor &std) {
        auto var = torch::square(std);
        return -torch::square(x - mean) / (2 * var) - torch::log(std) - std::log(std::sqrt(2 * M_PI));
    }

    std::pair<torch::Tensor, torch::Tensor> squashed_gaussian_sample(const torch::Tensor &mean,
                                                                     const torch::Tensor &std,
                                                                     const torch::Tensor &noise,
                                                                     const torch::Tensor &scale,
                                                                     const torch::Tensor &bias) {
        auto x = mean + std * noise;
        auto y = torch::tanh(x);
        auto action = y * scale + bias;
        auto log_prob = normal_log_prob(x, mean, std);
        // change of variables through tanh and the affine map
        log_prob = log_prob - torch::log(scale * (1 - torch::square(y)) + TANH_LOG_PROB_EPSILON);
        log_prob = torch::sum(log_prob, -1);
        return std::make_pair(action, log_prob);
    }
}
