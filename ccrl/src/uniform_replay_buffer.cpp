#include "replay_buffer/uniform_replay_buffer.h"

namespace ccrl::replay_buffer {

    UniformReplayBuffer::UniformReplayBuffer(int64_t capacity, const str_to_dataspec &data_spec)
            : ReplayBuffer(capacity, data_spec) {

    }

    torch::Tensor UniformReplayBuffer::generate_idx(int64_t batch_size) const {
        auto idx = torch::randint(size(), {batch_size}, torch::TensorOptions().dtype(torch::kInt64));
        return idx;
    }
}
