#ifndef CCRL_SQUEEZE_H
#define CCRL_SQUEEZE_H

#include <torch/torch.h>

namespace ccrl::nn {
    class SqueezeImpl : public torch::nn::Cloneable<SqueezeImpl> {
    public:
        explicit SqueezeImpl(int64_t dim);

        torch::Tensor forward(const torch::Tensor &x);

        void reset() override;

    private:
        int64_t dim;
    };


    TORCH_MODULE(Squeeze);
}


#endif //CCRL_SQUEEZE_H
