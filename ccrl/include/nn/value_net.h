#ifndef CCRL_VALUE_NET_H
#define CCRL_VALUE_NET_H

#include <torch/torch.h>
#include "nn/functional.h"

namespace ccrl::nn {
    /*
     * num_ensembles independent Q(s, a) estimators. forward returns (num_ensembles, None) when reduce is false and
     * the element-wise minimum over the ensemble (None,) otherwise.
     */
    class EnsembleMinQNetImpl : public torch::nn::Module {
    public:
        const int64_t num_ensembles;

        explicit EnsembleMinQNetImpl(int64_t obs_dim, int64_t act_dim, int64_t mlp_hidden, int64_t num_ensembles = 2,
                                     int64_t num_layers = 3);

        torch::Tensor forward(const torch::Tensor &obs, const torch::Tensor &act, bool reduce);

    private:
        StackSequential model{nullptr};
    };

    TORCH_MODULE(EnsembleMinQNet);
}


#endif //CCRL_VALUE_NET_H
