#include "agent/off_policy_agent.h"
#include "utils/rl_functional.h"
#include "nn/functional.h"
#include "spdlog/spdlog.h"

#include <filesystem>
#include <sstream>

namespace ccrl::agent {
    namespace fs = std::filesystem;

    void to_json(nlohmann::json &j, const OffPolicyConfig &config) {
        j["mlp_hidden"] = config.mlp_hidden;
        j["num_layers"] = config.num_layers;
        j["policy_lr"] = config.policy_lr;
        j["q_lr"] = config.q_lr;
        j["tau"] = config.tau;
        j["gamma"] = config.gamma;
        j["batch_size"] = config.batch_size;
        j["replay_size"] = config.replay_size;
        if (config.max_grad_norm != std::nullopt) {
            j["max_grad_norm"] = config.max_grad_norm.value();
        } else {
            j["max_grad_norm"] = nullptr;
        }
    }

    const gym::space::Box &as_box(const gym::space::Space &space) {
        auto box = dynamic_cast<const gym::space::Box *>(&space);
        if (box == nullptr || box->get_shape().size() != 1) {
            throw std::runtime_error("Only support flat continuous observation and action spaces");
        }
        return *box;
    }

    OffPolicyAgent::OffPolicyAgent(const std::string &name, const gym::space::Space &obs_space,
                                   const gym::space::Space &act_space, const OffPolicyConfig &config) :
            torch::nn::Module(name),
            obs_dim(as_box(obs_space).get_shape()[0]),
            act_dim(as_box(act_space).get_shape()[0]),
            tau(config.tau),
            gamma(config.gamma),
            batch_size(config.batch_size),
            max_grad_norm(config.max_grad_norm) {
        if (batch_size <= 0) {
            throw std::invalid_argument(fmt::format("Batch size must be positive. Got {}", batch_size));
        }
        const auto &act_box = as_box(act_space);
        act_low = register_buffer("act_low", act_box.get_low().clone());
        act_high = register_buffer("act_high", act_box.get_high().clone());

        q_network = register_module("q_network", nn::EnsembleMinQNet(obs_dim, act_dim, config.mlp_hidden, 2,
                                                                     config.num_layers));
        target_q_network = register_module("target_q_network",
                                           nn::EnsembleMinQNet(obs_dim, act_dim, config.mlp_hidden, 2,
                                                               config.num_layers));
        q_optimizer = std::make_unique<torch::optim::Adam>(q_network->parameters(),
                                                           torch::optim::AdamOptions(config.q_lr));
        buffer = std::make_unique<replay_buffer::UniformReplayBuffer>(
                config.replay_size, replay_buffer::transition_data_spec(obs_dim, act_dim));

        this->update_target_q(false);
    }

    void OffPolicyAgent::update_target_q(bool soft) {
        if (soft) {
            ccrl::functional::soft_update(*target_q_network, *q_network, tau);
        } else {
            ccrl::functional::hard_update(*target_q_network, *q_network);
        }
    }

    void OffPolicyAgent::set_logger(const std::shared_ptr<ccrl::logger::EpochLogger> &logger) {
        this->m_logger = logger;
    }

    void OffPolicyAgent::remember(const torch::Tensor &obs, const torch::Tensor &act, float rew,
                                  const torch::Tensor &next_obs, bool done) {
        buffer->store(obs, act, rew, next_obs, done);
    }

    bool OffPolicyAgent::learn() {
        if (buffer->size() < min_replay_size()) {
            return false;
        }
        auto dev = device();
        auto data = buffer->sample(batch_size);
        this->train_step(data.at("obs").to(dev),
                         data.at("act").to(dev),
                         data.at("next_obs").to(dev),
                         data.at("rew").to(dev),
                         data.at("done").to(dev));
        return true;
    }

    torch::Tensor
    OffPolicyAgent::update_q_net(const torch::Tensor &obs, const torch::Tensor &act, const torch::Tensor &q_target) {
        q_optimizer->zero_grad();
        auto q_values = this->q_network->forward(obs, act, false); // (num_ensemble, None)
        // every critic regresses to the same target. The loss is the sum of their mean squared errors.
        auto q_values_loss = torch::mean(torch::square(q_values - torch::unsqueeze(q_target, 0)), 1);
        q_values_loss = torch::sum(q_values_loss);
        q_values_loss.backward();
        clip_grad(q_network->parameters());
        q_optimizer->step();
        if (m_logger) {
            for (int64_t i = 0; i < q_network->num_ensembles; i++) {
                m_logger->store(fmt::format("Q{}Vals", i + 1),
                                ccrl::nn::convert_tensor_to_flat_vector<float>(q_values.index({i}).detach()));
            }
            m_logger->store("LossQ", q_values_loss.item<float>());
        }
        return q_values_loss.detach();
    }

    void OffPolicyAgent::clip_grad(const std::vector<torch::Tensor> &parameters) const {
        if (max_grad_norm != std::nullopt) {
            torch::nn::utils::clip_grad_norm_(parameters, max_grad_norm.value());
        }
    }

    std::map<std::string, std::shared_ptr<torch::nn::Module>> OffPolicyAgent::checkpoint_modules() const {
        return {{"critic",        q_network.ptr()},
                {"target_critic", target_q_network.ptr()}};
    }

    std::map<std::string, torch::Tensor> OffPolicyAgent::checkpoint_tensors() const {
        return {};
    }

    void OffPolicyAgent::post_load() {

    }

    void OffPolicyAgent::save_checkpoint(const std::string &checkpoint_dir) {
        auto dir = fs::path(checkpoint_dir) / name();
        fs::create_directories(dir);
        for (const auto &it: checkpoint_modules()) {
            torch::save(it.second, (dir / (it.first + ".pt")).string());
        }
        for (const auto &it: checkpoint_tensors()) {
            torch::save(it.second, (dir / (it.first + ".pt")).string());
        }
        spdlog::info("Saved {} checkpoint to {}", name(), dir.string());
    }

    static std::map<std::string, std::vector<int64_t>> collect_shapes(const torch::nn::Module &module) {
        std::map<std::string, std::vector<int64_t>> shapes;
        for (const auto &it: module.named_parameters()) {
            shapes[it.key()] = it.value().sizes().vec();
        }
        for (const auto &it: module.named_buffers()) {
            shapes[it.key()] = it.value().sizes().vec();
        }
        return shapes;
    }

    LoadResult OffPolicyAgent::load_checkpoint(const std::string &checkpoint_dir) {
        auto dir = fs::path(checkpoint_dir) / name();
        auto modules = checkpoint_modules();
        auto tensors = checkpoint_tensors();

        std::vector<std::string> stems;
        for (const auto &it: modules) stems.push_back(it.first);
        for (const auto &it: tensors) stems.push_back(it.first);
        for (const auto &stem: stems) {
            auto path = dir / (stem + ".pt");
            if (!fs::exists(path)) {
                return LoadResult::failure(fmt::format("Missing checkpoint file {}", path.string()));
            }
        }

        // keep the current state so that a partial or mismatched load can be rolled back
        std::stringstream backup;
        {
            torch::serialize::OutputArchive archive;
            this->save(archive);
            archive.save_to(backup);
        }
        auto expected_shapes = collect_shapes(*this);
        // map every tensor onto the device the agent lives on, whatever device it was saved from
        auto dev = device();

        try {
            for (auto &it: modules) {
                torch::load(it.second, (dir / (it.first + ".pt")).string(), dev);
            }
            for (auto &it: tensors) {
                torch::load(it.second, (dir / (it.first + ".pt")).string(), dev);
            }
            if (collect_shapes(*this) != expected_shapes) {
                throw std::runtime_error("Checkpoint doesn't match the network architecture");
            }
        } catch (const std::exception &e) {
            torch::serialize::InputArchive archive;
            archive.load_from(backup, dev);
            this->load(archive);
            return LoadResult::failure(fmt::format("Failed to load checkpoint from {}: {}", dir.string(), e.what()));
        }

        post_load();
        spdlog::info("Loaded {} checkpoint from {}", name(), dir.string());
        return LoadResult::ok();
    }

    const replay_buffer::ReplayBuffer &OffPolicyAgent::get_buffer() const {
        return *buffer;
    }

    int64_t OffPolicyAgent::get_act_dim() const {
        return act_dim;
    }

    torch::Device OffPolicyAgent::device() const {
        return q_network->parameters().front().device();
    }

    nn::EnsembleMinQNet OffPolicyAgent::get_q_network() const {
        return q_network;
    }

    nn::EnsembleMinQNet OffPolicyAgent::get_target_q_network() const {
        return target_q_network;
    }
}
