#ifndef CCRL_TORCH_UTILS_H
#define CCRL_TORCH_UTILS_H

#include <torch/torch.h>
#include <string>

namespace ccrl::ptu {
    // "cpu" or "gpu". Falls back to the CPU when CUDA is unavailable.
    torch::Device get_torch_device(const std::string &device_name);
}


#endif //CCRL_TORCH_UTILS_H
