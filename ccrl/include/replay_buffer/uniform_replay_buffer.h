#ifndef CCRL_UNIFORM_REPLAY_BUFFER_H
#define CCRL_UNIFORM_REPLAY_BUFFER_H

#include "replay_buffer_base.h"

namespace ccrl::replay_buffer {
    class UniformReplayBuffer final : public ReplayBuffer {
    public:
        explicit UniformReplayBuffer(int64_t capacity, const str_to_dataspec &data_spec);

        // uniform with replacement over the valid rows
        [[nodiscard]] torch::Tensor generate_idx(int64_t batch_size) const override;


    };
}


#endif //CCRL_UNIFORM_REPLAY_BUFFER_H
