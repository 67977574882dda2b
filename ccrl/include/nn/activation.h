#ifndef CCRL_ACTIVATION_H
#define CCRL_ACTIVATION_H


#include <torch/torch.h>
#include <string>

namespace ccrl::nn {
    // create a general activation module with activation function created via string
    class ActivationImpl : public torch::nn::Cloneable<ActivationImpl> {
    public:
        explicit ActivationImpl(std::string name);

        torch::Tensor forward(const torch::Tensor &x);

        void reset() override;

    private:
        std::string name;
    };

    TORCH_MODULE(Activation);
}


#endif //CCRL_ACTIVATION_H
