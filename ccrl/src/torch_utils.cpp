#include "utils/torch_utils.h"
#include "spdlog/spdlog.h"
#include "fmt/format.h"

namespace ccrl::ptu {
    torch::Device get_torch_device(const std::string &device_name) {
        if (device_name != "cpu" && device_name != "gpu") {
            throw std::runtime_error(fmt::format("Unknown device {}. Expect cpu or gpu", device_name));
        }
        if (device_name == "gpu") {
            if (torch::cuda::is_available()) {
                spdlog::info("Training on GPU with {} CUDA device(s) visible", torch::cuda::device_count());
                return torch::Device(torch::kCUDA);
            }
            spdlog::warn("CUDA is not available. Falling back to CPU");
        }
        spdlog::info("Training on CPU");
        return torch::Device(torch::kCPU);
    }
}
