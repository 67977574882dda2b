#ifndef CCRL_STACK_SEQUENTIAL_H
#define CCRL_STACK_SEQUENTIAL_H

#include <torch/torch.h>

namespace ccrl::nn {
    // Sequential with a concrete tensor -> tensor forward
    class StackSequentialImpl : public torch::nn::SequentialImpl {
    public:
        using SequentialImpl::SequentialImpl;

        torch::Tensor forward(torch::Tensor x);
    };

    TORCH_MODULE(StackSequential);
}

#endif //CCRL_STACK_SEQUENTIAL_H
