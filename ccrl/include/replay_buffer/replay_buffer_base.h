#ifndef CCRL_REPLAY_BUFFER_BASE_H
#define CCRL_REPLAY_BUFFER_BASE_H

#include <map>
#include <torch/torch.h>
#include <utility>
#include <vector>
#include "fmt/format.h"
#include "fmt/ranges.h"
#include "type.h"

namespace ccrl::replay_buffer {

    // data spec of a (obs, act, rew, next_obs, done) transition with flat observation and action
    str_to_dataspec transition_data_spec(int64_t obs_dim, int64_t act_dim);

    /*
     * Fixed capacity circular storage. Each field lives in one preallocated tensor whose leading dimension is the
     * capacity. m_count is the total number of rows ever written; the valid rows are [0, min(m_count, capacity)) and
     * the next row is written at m_count % capacity.
     */
    class ReplayBuffer {
    public:
        explicit ReplayBuffer(int64_t capacity, const str_to_dataspec &data_spec);

        virtual ~ReplayBuffer() = default;

        // pure virtual function
        [[nodiscard]] virtual torch::Tensor generate_idx(int64_t batch_size) const = 0;

        virtual str_to_tensor sample(int64_t batch_size);

        void reset();

        [[nodiscard]] bool empty() const;

        [[nodiscard]] bool full() const;

        [[nodiscard]] int64_t size() const;

        [[nodiscard]] int64_t capacity() const;

        [[nodiscard]] int64_t count() const;

        virtual str_to_tensor operator[](const torch::Tensor &idx) const;

        [[nodiscard]] str_to_tensor get() const;

        [[nodiscard]] const str_to_tensor &get_storage() const;

        virtual void add_batch(const str_to_tensor &data);

        void add_single(const str_to_tensor &data);

        // only valid for buffers created with transition_data_spec
        void store(const torch::Tensor &obs, const torch::Tensor &act, float rew, const torch::Tensor &next_obs,
                   bool done);

    protected:
        str_to_tensor m_storage;
        int64_t m_capacity;
        int64_t m_count{};
        const str_to_dataspec data_spec;
    };
}

#endif //CCRL_REPLAY_BUFFER_BASE_H
