#ifndef GYM_CPP_PENDULUM_H
#define GYM_CPP_PENDULUM_H

#include <random>
#include "gym_cpp/envs/env.h"

namespace gym::env {
    /*
     * Inverted pendulum swing-up with the Pendulum-v1 dynamics.
     * Observation (cos theta, sin theta, theta_dot), action torque in [-2, 2].
     * Episodes never terminate on their own and are cut after max_episode_steps with timeout set.
     */
    class PendulumEnv : public Env {
    public:
        explicit PendulumEnv(int64_t max_episode_steps = 200, float g = 10.0);

        void reset(State &state) override;

        void step(const torch::Tensor &action, State &state) override;

        void close() override;

        void seed(int64_t seed) override;

    private:
        [[nodiscard]] torch::Tensor get_obs() const;

        static constexpr float max_speed = 8.;
        static constexpr float max_torque = 2.;
        static constexpr float dt = .05;
        static constexpr float m = 1.;
        static constexpr float l = 1.;

        const int64_t max_episode_steps;
        const float g;
        float theta{};
        float theta_dot{};
        int64_t elapsed_steps{};
        bool needs_reset = true;
        std::mt19937_64 rng;
    };
}

#endif //GYM_CPP_PENDULUM_H
