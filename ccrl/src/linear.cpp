#include "nn/linear.h"

namespace ccrl::nn {
    EnsembleLinearImpl::EnsembleLinearImpl(int64_t num_ensembles, int64_t in_features, int64_t out_features,
                                           bool use_bias) :
            in_features(in_features),
            out_features(out_features),
            num_ensembles(num_ensembles),
            use_bias(use_bias) {
        reset();
    }

    // same initialization as torch::nn::Linear, applied per ensemble member
    void EnsembleLinearImpl::reset_parameters() {
        auto fan = this->in_features;
        auto gain = torch::nn::init::calculate_gain(torch::kLeakyReLU, sqrt(5.));
        auto stddev = gain / sqrt(fan);
        auto bound = sqrt(3.0) * stddev;
        torch::NoGradGuard no_grad;
        torch::nn::init::uniform_(weight, -bound, bound);
        if (use_bias) {
            bound = 1 / sqrt(fan);
            torch::nn::init::uniform_(bias, -bound, bound);
        }
    }

    torch::Tensor EnsembleLinearImpl::forward(const torch::Tensor &x) {
        auto output = torch::bmm(x, weight);
        if (use_bias) {
            output = output + bias;
        }
        return output;
    }

    void EnsembleLinearImpl::reset() {
        this->weight = register_parameter("weight", torch::empty({num_ensembles, in_features, out_features}));
        if (use_bias) {
            this->bias = register_parameter("bias", torch::empty({num_ensembles, 1, out_features}));
        }
        reset_parameters();
    }
}
