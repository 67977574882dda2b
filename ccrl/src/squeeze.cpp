#include "nn/squeeze.h"

namespace ccrl::nn {
    SqueezeImpl::SqueezeImpl(int64_t dim) : dim(dim) {

    }

    torch::Tensor SqueezeImpl::forward(const torch::Tensor &x) {
        return x.squeeze(dim);
    }

    void SqueezeImpl::reset() {

    }

}
