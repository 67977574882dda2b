#include "gym_cpp/envs/env.h"

#include <utility>

namespace gym::env {
    Env::Env(std::string env_name) : env_name(std::move(env_name)) {

    }

    Env::~Env() = default;

    std::string Env::get_env_name() const {
        return env_name;
    }
}
