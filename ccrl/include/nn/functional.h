#ifndef CCRL_FUNCTIONAL_H
#define CCRL_FUNCTIONAL_H

#include <torch/torch.h>
#include <optional>
#include <string>
#include "fmt/format.h"
#include "nn/activation.h"
#include "nn/linear.h"
#include "nn/squeeze.h"
#include "nn/stack_sequential.h"

namespace ccrl::nn {
    StackSequential build_mlp(int64_t input_dim, int64_t output_dim, int64_t mlp_hidden,
                              int64_t num_layers = 3, const std::string &activation = "relu", bool squeeze = false,
                              const std::optional<std::string> &out_activation = std::nullopt,
                              std::optional<int64_t> num_ensembles = std::nullopt);

    template<class T>
    std::vector<T> convert_tensor_to_flat_vector(const torch::Tensor &tensor) {
        torch::Tensor t = torch::flatten(tensor.cpu()).contiguous().to(torch::CppTypeToScalarType<T>());
        return {t.data_ptr<T>(), t.data_ptr<T>() + t.numel()};
    }
}


#endif //CCRL_FUNCTIONAL_H
