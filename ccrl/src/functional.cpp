#include "nn/functional.h"

namespace ccrl::nn {
    StackSequential
    build_mlp(int64_t input_dim, int64_t output_dim, int64_t mlp_hidden, int64_t num_layers,
              const std::string &activation,
              bool squeeze, const std::optional<std::string> &out_activation, std::optional<int64_t> num_ensembles) {
        if (num_layers < 1) {
            throw std::invalid_argument(fmt::format("An MLP needs at least one layer. Got {}", num_layers));
        }
        auto make_linear = [&num_ensembles](int64_t in_features, int64_t out_features) -> torch::nn::AnyModule {
            if (num_ensembles == std::nullopt) {
                return torch::nn::AnyModule(torch::nn::Linear(in_features, out_features));
            } else {
                return torch::nn::AnyModule(EnsembleLinear(num_ensembles.value(), in_features, out_features));
            }
        };

        auto model = StackSequential();
        if (num_layers == 1) {
            model->push_back(make_linear(input_dim, output_dim));
        } else {
            // add first layer
            model->push_back(make_linear(input_dim, mlp_hidden));
            model->push_back(Activation(activation));

            // intermediate layers
            for (int i = 0; i < num_layers - 2; i++) {
                model->push_back(make_linear(mlp_hidden, mlp_hidden));
                model->push_back(Activation(activation));
            }

            // last layer
            model->push_back(make_linear(mlp_hidden, output_dim));
        }

        // last activation
        if (out_activation != std::nullopt) {
            model->push_back(Activation(out_activation.value()));
        }
        // optional squeeze
        if (output_dim == 1 && squeeze) {
            model->push_back(Squeeze(-1));
        }

        return model;
    }

}
