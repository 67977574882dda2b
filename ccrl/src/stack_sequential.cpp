#include "nn/stack_sequential.h"

namespace ccrl::nn {
    torch::Tensor StackSequentialImpl::forward(torch::Tensor x) {
        return SequentialImpl::forward(std::move(x));
    }
}
