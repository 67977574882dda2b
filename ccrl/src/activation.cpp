#include "nn/activation.h"
#include "fmt/core.h"


namespace ccrl::nn {
    ActivationImpl::ActivationImpl(std::string name) : name(std::move(name)) {
        if (this->name != "relu" && this->name != "tanh" && this->name != "sigmoid") {
            throw std::runtime_error(fmt::format("Unknown activation {}", this->name));
        }
    }

    torch::Tensor ActivationImpl::forward(const torch::Tensor &x) {
        if (name == "relu") {
            return x.relu();
        } else if (name == "tanh") {
            return x.tanh();
        } else {
            return x.sigmoid();
        }
    }

    void ActivationImpl::reset() {

    }

}
