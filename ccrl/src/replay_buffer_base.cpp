#include "replay_buffer/replay_buffer_base.h"

using namespace torch::indexing;

namespace ccrl::replay_buffer {

    str_to_dataspec transition_data_spec(int64_t obs_dim, int64_t act_dim) {
        return str_to_dataspec{
                {"obs",      DataSpec({obs_dim}, torch::kFloat32)},
                {"act",      DataSpec({act_dim}, torch::kFloat32)},
                {"next_obs", DataSpec({obs_dim}, torch::kFloat32)},
                {"rew",      DataSpec({}, torch::kFloat32)},
                {"done",     DataSpec({}, torch::kFloat32)},
        };
    }

    ReplayBuffer::ReplayBuffer(int64_t capacity, const str_to_dataspec &data_spec) :
            m_capacity(capacity),
            data_spec(data_spec) {
        if (capacity <= 0) {
            throw std::invalid_argument(fmt::format("Replay buffer capacity must be positive. Got {}", capacity));
        }
        for (auto &it: data_spec) {
            auto name = it.first;
            auto shape = it.second.m_shape;
            shape.insert(shape.begin(), capacity);
            m_storage[name] = torch::zeros(shape, torch::TensorOptions().dtype(it.second.m_dtype));
        }
        reset();
    }

    str_to_tensor ReplayBuffer::sample(int64_t batch_size) {
        if (empty()) {
            throw std::runtime_error("Can't sample from an empty replay buffer");
        }
        auto idx = generate_idx(batch_size);
        return this->operator[](idx);
    }

    void ReplayBuffer::reset() {
        m_count = 0;
    }

    int64_t ReplayBuffer::size() const {
        return std::min(m_count, m_capacity);
    }

    int64_t ReplayBuffer::capacity() const {
        return m_capacity;
    }

    int64_t ReplayBuffer::count() const {
        return m_count;
    }

    // get data by index
    str_to_tensor ReplayBuffer::operator[](const torch::Tensor &idx) const {
        str_to_tensor output;
        for (auto &it: m_storage) {
            output[it.first] = it.second.index({idx});
        }
        return output;
    }

    // get all the valid data
    str_to_tensor ReplayBuffer::get() const {
        torch::Tensor idx = torch::arange(size());
        return this->operator[](idx);
    }

    const str_to_tensor &ReplayBuffer::get_storage() const {
        return m_storage;
    }

    // add data samples. A batch that runs past the end wraps around to the front.
    void ReplayBuffer::add_batch(const str_to_tensor &data) {
        if (data.size() != m_storage.size()) {
            throw std::invalid_argument(fmt::format("Expect {} fields. Got {}", m_storage.size(), data.size()));
        }
        int64_t batch_size = data.begin()->second.size(0);
        if (batch_size > capacity()) {
            throw std::invalid_argument(
                    fmt::format("Batch of size {} doesn't fit into a buffer of capacity {}", batch_size, capacity()));
        }
        for (auto &it: data) {
            if (!m_storage.contains(it.first)) {
                throw std::invalid_argument(fmt::format("Unknown field {}", it.first));
            }
            auto expected_shape = data_spec.at(it.first).m_shape;
            expected_shape.insert(expected_shape.begin(), batch_size);
            if (it.second.sizes() != torch::IntArrayRef(expected_shape)) {
                throw std::invalid_argument(fmt::format("Field {} has shape {}. Expect {}", it.first,
                                                        fmt::join(it.second.sizes(), ", "),
                                                        fmt::join(expected_shape, ", ")));
            }
        }
        int64_t ptr = m_count % capacity();
        for (auto &it: data) {
            auto value = it.second.to(m_storage[it.first].dtype());
            if (ptr + batch_size > capacity()) {
                m_storage[it.first].index_put_({Slice(ptr, None)},
                                               value.index({Slice(None, capacity() - ptr)}));
                m_storage[it.first].index_put_({Slice(None, batch_size - (capacity() - ptr))},
                                               value.index({Slice(capacity() - ptr, None)}));
            } else {
                m_storage[it.first].index_put_({Slice(ptr, ptr + batch_size)}, value);
            }
        }
        m_count += batch_size;
    }

    // add one data sample
    void ReplayBuffer::add_single(const str_to_tensor &data) {
        // add batch dimension
        str_to_tensor batch;
        for (auto &it: data) {
            batch[it.first] = it.second.unsqueeze(0);
        }
        this->add_batch(batch);
    }

    void ReplayBuffer::store(const torch::Tensor &obs, const torch::Tensor &act, float rew,
                             const torch::Tensor &next_obs, bool done) {
        str_to_tensor single_data{{"obs",      obs.detach().cpu()},
                                  {"act",      act.detach().cpu()},
                                  {"next_obs", next_obs.detach().cpu()},
                                  {"rew",      torch::tensor(rew)},
                                  {"done",     torch::tensor(done ? 1.f : 0.f)}};
        this->add_single(single_data);
    }

    bool ReplayBuffer::empty() const {
        return size() == 0;
    }

    bool ReplayBuffer::full() const {
        return size() == capacity();
    }

}
