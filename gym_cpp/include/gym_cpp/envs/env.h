#ifndef GYM_CPP_ENV_H
#define GYM_CPP_ENV_H

#include <torch/torch.h>
#include <memory>
#include <string>

#include "gym_cpp/spaces/space.h"

#include "nlohmann/json.hpp"

namespace gym::env {
    using json = nlohmann::json;

    struct State {
        torch::Tensor observation;
        float reward{};
        bool done{};
        // done because the episode hit its time limit rather than a terminal state
        bool timeout{};
        json info;
    };

    class Env {
    public:
        explicit Env(std::string env_name);

        virtual ~Env();

        virtual void reset(State &state) = 0;

        virtual void step(const torch::Tensor &action, State &state) = 0;

        virtual void close() = 0;

        virtual void seed(int64_t seed) = 0;

        [[nodiscard]] std::string get_env_name() const;

        std::shared_ptr<space::Space> observation_space;
        std::shared_ptr<space::Space> action_space;

    protected:
        const std::string env_name;

    };
}

#endif //GYM_CPP_ENV_H
