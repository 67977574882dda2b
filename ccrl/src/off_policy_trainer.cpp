#include "trainer/off_policy_trainer.h"

#include <utility>
#include "spdlog/spdlog.h"

namespace ccrl::trainer {

    void to_json(nlohmann::json &j, const TrainerConfig &config) {
        j["epochs"] = config.epochs;
        j["steps_per_epoch"] = config.steps_per_epoch;
        j["start_steps"] = config.start_steps;
        j["update_after"] = config.update_after;
        j["update_every"] = config.update_every;
        j["update_per_step"] = config.update_per_step;
        j["num_test_episodes"] = config.num_test_episodes;
        j["seed"] = config.seed;
        j["save_freq"] = config.save_freq;
        if (config.checkpoint_dir != std::nullopt) {
            j["checkpoint_dir"] = config.checkpoint_dir.value();
        } else {
            j["checkpoint_dir"] = nullptr;
        }
        j["load_checkpoint"] = config.load_checkpoint;
    }

    OffPolicyTrainer::OffPolicyTrainer(const std::function<std::shared_ptr<gym::env::Env>()> &env_fn,
                                       const std::function<std::shared_ptr<agent::OffPolicyAgent>()> &agent_fn,
                                       const TrainerConfig &config,
                                       torch::Device device) :
            env(env_fn()),
            test_env(env_fn()),
            agent(agent_fn()),
            config(config),
            device(device) {
        if (config.update_every <= 0 || config.update_per_step <= 0) {
            throw std::invalid_argument(fmt::format("update_every and update_per_step must be positive. Got {} and {}",
                                                    config.update_every, config.update_per_step));
        }
        if (config.save_freq <= 0) {
            throw std::invalid_argument(fmt::format("save_freq must be positive. Got {}", config.save_freq));
        }
        env->seed(config.seed);
        // keep evaluation episodes independent of the training episodes
        test_env->seed(config.seed + 10);
    }

    OffPolicyTrainer::~OffPolicyTrainer() {
        env->close();
        test_env->close();
    }

    void OffPolicyTrainer::setup_logger(std::optional<std::string> exp_name, const std::string &data_dir,
                                        const nlohmann::json &extra_config) {
        spdlog::info("Setting up the logger");
        if (exp_name == std::nullopt) {
            exp_name.emplace(env->get_env_name() + "_" + agent->name());
        }
        auto output_dir = logger::setup_logger_kwargs(exp_name.value(), config.seed, data_dir);
        logger = std::make_shared<logger::EpochLogger>(output_dir, exp_name.value());
        agent->set_logger(logger);

        nlohmann::json root = extra_config;
        root["exp_name"] = exp_name.value();
        root["env_id"] = env->get_env_name();
        root["algorithm"] = agent->name();
        root["trainer"] = config;
        logger->save_config(root);
    }

    void OffPolicyTrainer::train() {
        if (logger == nullptr) {
            throw std::runtime_error("Call setup_logger before train");
        }
        agent->to(device);
        if (config.load_checkpoint) {
            if (config.checkpoint_dir == std::nullopt) {
                spdlog::warn("No checkpoint directory given. Start from scratch");
            } else {
                auto result = agent->load_checkpoint(config.checkpoint_dir.value());
                if (!result) {
                    spdlog::warn("{}. Start from scratch", result.reason);
                }
            }
        }
        tester = std::make_unique<Tester>(test_env, agent, logger, config.num_test_episodes);

        this->reset();
        watcher.reset();
        watcher.start();
        env->reset(s);

        spdlog::info("Start training");

        for (int64_t epoch = 1; epoch <= config.epochs; epoch++) {
            for (int64_t step = 0; step < config.steps_per_epoch; step++) {
                train_step();
                total_steps += 1;
            }

            // test the current policy
            tester->run();

            maybe_save(epoch);

            watcher.lap();

            logger->log_tabular("Epoch", static_cast<float>(epoch));
            logger->log_tabular("EpRet", std::nullopt, true);
            logger->log_tabular("EpLen", std::nullopt, false, true);
            tester->log_tabular();
            logger->log_tabular("TotalEnvInteracts", static_cast<float>(total_steps));
            agent->log_tabular();
            logger->log_tabular("Time", static_cast<float>(watcher.seconds()));
            logger->dump_tabular();
        }
    }

    void OffPolicyTrainer::train_step() {
        torch::Tensor action;
        auto current_obs = s.observation;
        if (total_steps < config.start_steps) {
            action = env->action_space->sample();
        } else {
            action = agent->act_single(current_obs, true).to(cpu);
        }

        env->step(action, s);

        // a time limit is not a terminal state, so the target still bootstraps from next_obs
        bool true_done = s.done && !s.timeout;
        agent->remember(current_obs, action, s.reward, s.observation, true_done);

        episode_rewards += s.reward;
        episode_length += 1;
        if (s.done) {
            logger->store({
                                  {"EpRet", std::vector<float>{episode_rewards}},
                                  {"EpLen", std::vector<float>{static_cast<float>(episode_length)}}
                          });
            spdlog::debug("Finish episode with return {}", episode_rewards);
            env->reset(s);
            episode_rewards = 0.;
            episode_length = 0;
        }

        if (total_steps >= config.update_after && total_steps % config.update_every == 0) {
            for (int64_t i = 0; i < config.update_every * config.update_per_step; i++) {
                if (!agent->learn()) {
                    spdlog::debug("Not enough data to learn. Buffer size {}", agent->get_buffer().size());
                    break;
                }
            }
        }
    }

    void OffPolicyTrainer::maybe_save(int64_t epoch) {
        if (config.checkpoint_dir == std::nullopt) {
            return;
        }
        if (epoch % config.save_freq != 0 && epoch != config.epochs) {
            return;
        }
        try {
            agent->save_checkpoint(config.checkpoint_dir.value());
        } catch (const std::exception &e) {
            spdlog::warn("Failed to save checkpoint at epoch {}: {}", epoch, e.what());
        }
    }

    void OffPolicyTrainer::reset() {
        total_steps = 0;
        episode_rewards = 0;
        episode_length = 0;
    }

    std::shared_ptr<agent::OffPolicyAgent> OffPolicyTrainer::get_agent() const {
        return agent;
    }

    std::shared_ptr<logger::EpochLogger> OffPolicyTrainer::get_logger() const {
        return logger;
    }

    int64_t OffPolicyTrainer::get_total_steps() const {
        return total_steps;
    }

}
