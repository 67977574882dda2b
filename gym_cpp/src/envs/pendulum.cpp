#include "gym_cpp/envs/pendulum.h"

#include <cmath>
#include <algorithm>

namespace gym::env {
    static float angle_normalize(float x) {
        float y = std::fmod(x + (float) M_PI, 2 * (float) M_PI);
        if (y < 0) y += 2 * (float) M_PI;
        return y - (float) M_PI;
    }

    PendulumEnv::PendulumEnv(int64_t max_episode_steps, float g) :
            Env("Pendulum-v1"),
            max_episode_steps(max_episode_steps),
            g(g),
            rng(std::random_device{}()) {
        auto high = torch::tensor({1.f, 1.f, max_speed});
        observation_space = std::make_shared<space::Box>(-high, high);
        action_space = std::make_shared<space::Box>(torch::tensor({-max_torque}), torch::tensor({max_torque}));
    }

    void PendulumEnv::reset(State &state) {
        std::uniform_real_distribution<float> theta_dist(-M_PI, M_PI);
        std::uniform_real_distribution<float> theta_dot_dist(-1., 1.);
        theta = theta_dist(rng);
        theta_dot = theta_dot_dist(rng);
        elapsed_steps = 0;
        needs_reset = false;
        state.observation = get_obs();
        state.reward = 0;
        state.done = false;
        state.timeout = false;
        state.info = json::object();
    }

    void PendulumEnv::step(const torch::Tensor &action, State &state) {
        if (needs_reset) {
            throw std::runtime_error("Cannot call step() before reset() or after the episode is done");
        }
        float u = std::clamp(action.flatten().index({0}).item<float>(), -max_torque, max_torque);

        float cost = std::pow(angle_normalize(theta), 2.f) + .1f * theta_dot * theta_dot + .001f * u * u;

        float new_theta_dot = theta_dot + (3 * g / (2 * l) * std::sin(theta) + 3. / (m * l * l) * u) * dt;
        new_theta_dot = std::clamp(new_theta_dot, -max_speed, max_speed);
        theta = theta + new_theta_dot * dt;
        theta_dot = new_theta_dot;
        elapsed_steps += 1;

        state.observation = get_obs();
        state.reward = -cost;
        state.timeout = elapsed_steps >= max_episode_steps;
        state.done = state.timeout;
        state.info = json::object();
        state.info["timeout"] = state.timeout;
        needs_reset = state.done;
    }

    void PendulumEnv::close() {
        needs_reset = true;
    }

    void PendulumEnv::seed(int64_t seed) {
        rng.seed(seed);
        action_space->seed(seed);
        observation_space->seed(seed);
    }

    torch::Tensor PendulumEnv::get_obs() const {
        return torch::tensor({std::cos(theta), std::sin(theta), theta_dot});
    }
}
