#include "gym_cpp/gym.h"
#include "gym_cpp/envs/pendulum.h"
#include "fmt/format.h"

namespace gym {
    std::shared_ptr<env::Env> make(const std::string &env_name) {
        if (env_name == "Pendulum-v1") {
            return std::make_shared<env::PendulumEnv>();
        } else {
            throw std::runtime_error(fmt::format("Unknown environment {}", env_name));
        }
    }
}
