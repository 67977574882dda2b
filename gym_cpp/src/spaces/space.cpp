#include "gym_cpp/spaces/space.h"
#include <ATen/CPUGeneratorImpl.h>
#include "fmt/format.h"

namespace gym::space {

    void Space::seed(uint64_t seed) {
        gen = at::detail::createCPUGenerator(seed);
    }

    Box::Box(torch::Tensor low, torch::Tensor high) : low(low.to(torch::kFloat32)), high(high.to(torch::kFloat32)) {
        if (this->low.sizes() != this->high.sizes()) {
            throw std::invalid_argument("Box low and high must have the same shape");
        }
        if (torch::any(this->low > this->high).item<bool>()) {
            throw std::invalid_argument("Box low must not exceed high");
        }
    }

    torch::Tensor Box::sample() {
        torch::Tensor result;
        if (gen) {
            result = torch::rand(low.sizes(), *gen);
        } else {
            result = torch::rand(low.sizes());
        }
        return result * (high - low) + low;
    }

    bool Box::contains(const torch::Tensor &x) const {
        if (x.sizes() != low.sizes()) {
            return false;
        }
        auto result = torch::logical_and(x.greater_equal(low), x.less_equal(high));
        return result.all().item<bool>();
    }

    torch::IntArrayRef Box::get_shape() const {
        return low.sizes();
    }

    const torch::Tensor &Box::get_low() const {
        return low;
    }

    const torch::Tensor &Box::get_high() const {
        return high;
    }
}
