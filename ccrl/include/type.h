#ifndef CCRL_TYPE_H
#define CCRL_TYPE_H

#include <torch/torch.h>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ccrl {
    struct DataSpec {
        torch::Dtype m_dtype;
        std::vector<int64_t> m_shape;

        DataSpec(std::vector<int64_t> shape, torch::Dtype dtype) : m_dtype(dtype), m_shape(std::move(shape)) {

        }
    };

    typedef std::unordered_map<std::string, torch::Tensor> str_to_tensor;
    typedef std::unordered_map<std::string, DataSpec> str_to_dataspec;

    /*
     * Outcome of restoring an agent from disk. A failed load leaves the agent in the state it had before the call.
     */
    struct LoadResult {
        bool success;
        std::string reason;

        static LoadResult ok() {
            return LoadResult{true, {}};
        }

        static LoadResult failure(std::string reason) {
            return LoadResult{false, std::move(reason)};
        }

        explicit operator bool() const {
            return success;
        }
    };

}

#endif //CCRL_TYPE_H
