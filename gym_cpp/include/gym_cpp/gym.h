#ifndef GYM_CPP_GYM_H
#define GYM_CPP_GYM_H

#include "gym_cpp/envs/env.h"
#include <memory>
#include <string>

namespace gym {
    // create an environment by id. Throws std::runtime_error for unknown ids.
    std::shared_ptr<env::Env> make(const std::string &env_name);
}


#endif //GYM_CPP_GYM_H
