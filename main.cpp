#include "agent/sac.h"
#include "agent/td3.h"
#include "trainer/off_policy_trainer.h"
#include "utils/torch_utils.h"
#include "gym_cpp/gym.h"
#include "cxxopts.hpp"
#include "spdlog/spdlog.h"
#include "fmt/core.h"

#include <iostream>

static cxxopts::ParseResult parse(int argc, char *argv[]) {
    try {
        cxxopts::Options options(argv[0], " - Training SAC and TD3 agents");
        options.positional_help("[optional args]").show_positional_help();
        options.add_options()
                ("help", "Print help")
                ("algorithm", "Algorithm, td3 or sac", cxxopts::value<std::string>()->default_value("sac"))
                ("env_id", "Environment id", cxxopts::value<std::string>()->default_value("Pendulum-v1"))
                ("exp_name", "Experiment name. Defaults to <env_id>_<algorithm>", cxxopts::value<std::string>())
                ("data_dir", "Directory of the experiment logs", cxxopts::value<std::string>()->default_value("data"))
                ("epochs", "Number of epochs", cxxopts::value<int64_t>()->default_value("100"))
                ("steps_per_epoch", "Number steps/epoch", cxxopts::value<int64_t>()->default_value("4000"))
                ("start_steps", "Number of steps that take uniform random actions",
                 cxxopts::value<int64_t>()->default_value("0"))
                ("update_after", "Number of steps before update",
                 cxxopts::value<int64_t>()->default_value("1000"))
                ("update_every", "Number of steps between updates",
                 cxxopts::value<int64_t>()->default_value("50"))
                ("update_per_step", "Number of updates per step", cxxopts::value<int64_t>()->default_value("1"))
                ("batch_size", "Size of one batch to perform update. Defaults to 100 for td3 and 256 for sac",
                 cxxopts::value<int64_t>())
                ("replay_size", "Size of the replay buffer",
                 cxxopts::value<int64_t>()->default_value("1000000"))
                ("num_test_episodes", "Number of test episodes", cxxopts::value<int64_t>()->default_value("10"))
                ("seed", "Random seed", cxxopts::value<int64_t>()->default_value("1"))
                ("device", "Pytorch device, cpu or gpu", cxxopts::value<std::string>()->default_value("cpu"))
                ("policy_lr", "Learning rate of the actor", cxxopts::value<float>())
                ("q_lr", "Learning rate of the critics", cxxopts::value<float>())
                ("tau", "Polyak averaging coefficient of the target networks",
                 cxxopts::value<float>()->default_value("0.005"))
                ("gamma", "Discount factor", cxxopts::value<float>()->default_value("0.99"))
                ("mlp_hidden", "Hidden units of every layer", cxxopts::value<int64_t>()->default_value("256"))
                ("update_actor_interval", "TD3 critic updates per actor update",
                 cxxopts::value<int64_t>()->default_value("2"))
                ("warmup", "TD3 number of pure noise actions", cxxopts::value<int64_t>()->default_value("1000"))
                ("actor_noise", "TD3 exploration noise", cxxopts::value<float>()->default_value("0.1"))
                ("target_noise", "TD3 target policy smoothing noise", cxxopts::value<float>()->default_value("0.2"))
                ("noise_clip", "TD3 target policy smoothing clip", cxxopts::value<float>()->default_value("0.5"))
                ("alpha", "SAC initial entropy coefficient", cxxopts::value<float>()->default_value("1.0"))
                ("alpha_lr", "SAC learning rate of the entropy coefficient",
                 cxxopts::value<float>()->default_value("0.001"))
                ("target_entropy", "SAC target entropy. Defaults to -act_dim", cxxopts::value<float>())
                ("checkpoint_dir", "Directory of the agent checkpoints", cxxopts::value<std::string>())
                ("load", "Load the checkpoint before training", cxxopts::value<bool>()->default_value("false"))
                ("save_freq", "Number of epochs between checkpoints", cxxopts::value<int64_t>()->default_value("10"))
                ("logging_level", "Logging level", cxxopts::value<int>()->default_value("2"));

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            exit(0);
        }

        return result;

    } catch (const std::exception &e) {
        std::cout << "error parsing options: " << e.what() << std::endl;
        exit(1);
    }
}

static void fill_off_policy_config(const cxxopts::ParseResult &result, ccrl::agent::OffPolicyConfig &config) {
    config.mlp_hidden = result["mlp_hidden"].as<int64_t>();
    config.tau = result["tau"].as<float>();
    config.gamma = result["gamma"].as<float>();
    config.replay_size = result["replay_size"].as<int64_t>();
    if (result.count("batch_size")) config.batch_size = result["batch_size"].as<int64_t>();
    if (result.count("policy_lr")) config.policy_lr = result["policy_lr"].as<float>();
    if (result.count("q_lr")) config.q_lr = result["q_lr"].as<float>();
}

static std::shared_ptr<ccrl::agent::OffPolicyAgent>
create_agent(const std::shared_ptr<gym::env::Env> &env, const std::string &algorithm,
             const cxxopts::ParseResult &result, nlohmann::json &agent_config) {
    std::shared_ptr<ccrl::agent::OffPolicyAgent> agent;
    if (algorithm == "td3") {
        ccrl::agent::TD3Config config;
        fill_off_policy_config(result, config);
        config.update_actor_interval = result["update_actor_interval"].as<int64_t>();
        config.warmup = result["warmup"].as<int64_t>();
        config.actor_noise = result["actor_noise"].as<float>();
        config.target_noise = result["target_noise"].as<float>();
        config.noise_clip = result["noise_clip"].as<float>();
        agent_config = config;
        agent = std::make_shared<ccrl::agent::TD3Agent>(*env->observation_space, *env->action_space, config);
    } else if (algorithm == "sac") {
        ccrl::agent::SACConfig config;
        fill_off_policy_config(result, config);
        config.alpha = result["alpha"].as<float>();
        config.alpha_lr = result["alpha_lr"].as<float>();
        if (result.count("target_entropy")) config.target_entropy = result["target_entropy"].as<float>();
        agent_config = config;
        agent = std::make_shared<ccrl::agent::SACAgent>(*env->observation_space, *env->action_space, config);
    } else {
        throw std::runtime_error(fmt::format("Unknown algorithm {}", algorithm));
    }
    return agent;
}

int main(int argc, char **argv) {
    try {
        auto result = parse(argc, argv);
        int logging_level = result["logging_level"].as<int>();
        spdlog::set_level(static_cast<spdlog::level::level_enum>(logging_level));
        torch::manual_seed(result["seed"].as<int64_t>());

        std::string algorithm(result["algorithm"].as<std::string>());
        std::string env_id = result["env_id"].as<std::string>();
        auto device = ccrl::ptu::get_torch_device(result["device"].as<std::string>());

        std::function<std::shared_ptr<gym::env::Env>()> env_fn = [&env_id]() {
            spdlog::info("Creating environment {}", env_id);
            return gym::make(env_id);
        };

        nlohmann::json agent_config;
        std::function<std::shared_ptr<ccrl::agent::OffPolicyAgent>()> agent_fn =
                [&env_fn, &algorithm, &result, &agent_config]() {
                    spdlog::info("Creating {} agent", algorithm);
                    auto env = env_fn();
                    auto agent = create_agent(env, algorithm, result, agent_config);
                    env->close();
                    return agent;
                };

        ccrl::trainer::TrainerConfig trainer_config;
        trainer_config.epochs = result["epochs"].as<int64_t>();
        trainer_config.steps_per_epoch = result["steps_per_epoch"].as<int64_t>();
        trainer_config.start_steps = result["start_steps"].as<int64_t>();
        trainer_config.update_after = result["update_after"].as<int64_t>();
        trainer_config.update_every = result["update_every"].as<int64_t>();
        trainer_config.update_per_step = result["update_per_step"].as<int64_t>();
        trainer_config.num_test_episodes = result["num_test_episodes"].as<int64_t>();
        trainer_config.seed = result["seed"].as<int64_t>();
        trainer_config.save_freq = result["save_freq"].as<int64_t>();
        if (result.count("checkpoint_dir")) {
            trainer_config.checkpoint_dir = result["checkpoint_dir"].as<std::string>();
        }
        trainer_config.load_checkpoint = result["load"].as<bool>();

        ccrl::trainer::OffPolicyTrainer trainer(env_fn, agent_fn, trainer_config, device);

        std::optional<std::string> exp_name;
        if (result.count("exp_name")) {
            exp_name = result["exp_name"].as<std::string>();
        }
        trainer.setup_logger(exp_name, result["data_dir"].as<std::string>(), {{"agent", agent_config}});
        trainer.train();

    } catch (const std::exception &e) {
        fprintf(stderr, "ERROR: %s\n", e.what());
        return 1;
    }

    return 0;
}
