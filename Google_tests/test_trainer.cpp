#include "gtest/gtest.h"
#include "agent/sac.h"
#include "agent/td3.h"
#include "trainer/off_policy_trainer.h"

#include <filesystem>
#include <fstream>

using namespace ccrl;
namespace fs = std::filesystem;

namespace {
    std::shared_ptr<gym::env::Env> make_env() {
        return gym::make("Pendulum-v1");
    }

    trainer::TrainerConfig tiny_config(const fs::path &root) {
        trainer::TrainerConfig config;
        config.epochs = 2;
        config.steps_per_epoch = 250;
        config.start_steps = 50;
        config.update_after = 50;
        config.update_every = 25;
        config.num_test_episodes = 1;
        config.save_freq = 1;
        config.checkpoint_dir = (root / "checkpoints").string();
        return config;
    }

    int64_t count_lines(const fs::path &path) {
        std::ifstream file(path);
        std::string line;
        int64_t n = 0;
        while (std::getline(file, line)) n++;
        return n;
    }
}

TEST(trainer, sac) {
    torch::manual_seed(1);
    auto root = fs::temp_directory_path() / "ccrl_trainer_sac";
    fs::remove_all(root);
    auto config = tiny_config(root);

    auto agent_fn = []() {
        auto env = make_env();
        agent::SACConfig agent_config;
        agent_config.mlp_hidden = 16;
        agent_config.batch_size = 16;
        return std::make_shared<agent::SACAgent>(*env->observation_space, *env->action_space, agent_config);
    };
    trainer::OffPolicyTrainer runner(make_env, agent_fn, config);
    runner.setup_logger(std::nullopt, (root / "data").string());
    runner.train();

    EXPECT_EQ(runner.get_total_steps(), 500);
    EXPECT_EQ(runner.get_agent()->get_buffer().size(), 500);
    auto output_dir = fs::path(runner.get_logger()->get_output_dir());
    EXPECT_EQ(output_dir.string(), (root / "data" / "Pendulum-v1_sac" / "Pendulum-v1_sac_s1").string());
    // header and one row per epoch
    EXPECT_EQ(count_lines(output_dir / "progress.txt"), 3);
    EXPECT_TRUE(fs::exists(output_dir / "config.json"));
    EXPECT_TRUE(fs::exists(root / "checkpoints" / "sac" / "log_alpha.pt"));

    // resume from the saved checkpoint
    config.load_checkpoint = true;
    config.epochs = 1;
    trainer::OffPolicyTrainer resumed(make_env, agent_fn, config);
    resumed.setup_logger("resumed", (root / "data").string());
    resumed.train();
    EXPECT_EQ(resumed.get_total_steps(), 250);
    fs::remove_all(root);
}

TEST(trainer, td3) {
    torch::manual_seed(1);
    auto root = fs::temp_directory_path() / "ccrl_trainer_td3";
    fs::remove_all(root);
    auto config = tiny_config(root);
    config.epochs = 1;

    auto agent_fn = []() {
        auto env = make_env();
        agent::TD3Config agent_config;
        agent_config.mlp_hidden = 16;
        agent_config.batch_size = 8;
        agent_config.warmup = 20;
        return std::make_shared<agent::TD3Agent>(*env->observation_space, *env->action_space, agent_config);
    };
    trainer::OffPolicyTrainer runner(make_env, agent_fn, config);
    runner.setup_logger("td3", (root / "data").string());
    runner.train();

    auto td3 = std::dynamic_pointer_cast<agent::TD3Agent>(runner.get_agent());
    ASSERT_NE(td3, nullptr);
    // updates start once the buffer holds 10 batches
    EXPECT_GT(td3->get_learn_step_counter(), 0);
    EXPECT_TRUE(fs::exists(root / "checkpoints" / "td3" / "target_actor.pt"));
    fs::remove_all(root);
}

TEST(trainer, requires_logger) {
    auto agent_fn = []() {
        auto env = make_env();
        return std::make_shared<agent::SACAgent>(*env->observation_space, *env->action_space);
    };
    trainer::TrainerConfig config;
    trainer::OffPolicyTrainer runner(make_env, agent_fn, config);
    EXPECT_THROW(runner.train(), std::runtime_error);
}
