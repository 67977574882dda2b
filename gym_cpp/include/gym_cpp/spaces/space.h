#ifndef GYM_CPP_SPACE_H
#define GYM_CPP_SPACE_H

#include <torch/torch.h>

#include <optional>
#include <utility>

namespace gym::space {
    class Space {
    public:
        virtual ~Space() = default;

        [[nodiscard]] virtual torch::Tensor sample() = 0;

        [[nodiscard]] virtual bool contains(const torch::Tensor &x) const = 0;

        void seed(uint64_t seed);

    protected:
        // global torch generator until seeded
        std::optional<torch::Generator> gen;
    };


    /*
     * Continuous space [low, high] with per-dimension bounds.
     */
    class Box : public Space {
    public:
        explicit Box(torch::Tensor low, torch::Tensor high);

        [[nodiscard]] torch::Tensor sample() override;

        [[nodiscard]] bool contains(const torch::Tensor &x) const override;

        [[nodiscard]] torch::IntArrayRef get_shape() const;

        [[nodiscard]] const torch::Tensor &get_low() const;

        [[nodiscard]] const torch::Tensor &get_high() const;

    private:
        const torch::Tensor low;
        const torch::Tensor high;

    };

}


#endif //GYM_CPP_SPACE_H
