#ifndef CCRL_LINEAR_H
#define CCRL_LINEAR_H

#include <torch/torch.h>

namespace ccrl::nn {
    /*
     * num_ensembles independent linear layers evaluated with one batched matmul.
     * Input (num_ensembles, None, in_features), output (num_ensembles, None, out_features).
     */
    class EnsembleLinearImpl : public torch::nn::Cloneable<EnsembleLinearImpl> {
    public:
        explicit EnsembleLinearImpl(int64_t num_ensembles, int64_t in_features, int64_t out_features,
                                    bool use_bias = true);

        void reset_parameters();

        torch::Tensor forward(const torch::Tensor &x);

        void reset() override;

    private:
        torch::Tensor weight;
        torch::Tensor bias;
        int64_t in_features;
        int64_t out_features;
        int64_t num_ensembles;
        bool use_bias;
    };

    TORCH_MODULE(EnsembleLinear);
}


#endif //CCRL_LINEAR_H
