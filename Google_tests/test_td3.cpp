#include "gtest/gtest.h"
#include "agent/td3.h"

#include <filesystem>

using namespace ccrl::agent;
namespace fs = std::filesystem;

namespace {
    std::vector<torch::Tensor> snapshot(const torch::nn::Module &module) {
        std::vector<torch::Tensor> result;
        for (const auto &p: module.parameters()) {
            result.push_back(p.detach().clone());
        }
        return result;
    }

    bool unchanged(const torch::nn::Module &module, const std::vector<torch::Tensor> &before) {
        auto params = module.parameters();
        for (size_t i = 0; i < params.size(); i++) {
            if (!torch::equal(params[i], before[i])) return false;
        }
        return true;
    }

    class TD3Test : public ::testing::Test {
    protected:
        void SetUp() override {
            torch::manual_seed(1);
            config.mlp_hidden = 16;
            config.batch_size = 4;
            config.replay_size = 100;
            config.warmup = 0;
            agent = std::make_shared<TD3Agent>(obs_space, act_space, config);
        }

        void fill(int64_t n) {
            for (int64_t i = 0; i < n; i++) {
                auto obs = torch::randn({3});
                agent->remember(obs, act_space.sample(), torch::randn({}).item<float>(), torch::randn({3}),
                                i % 10 == 9);
            }
        }

        gym::space::Box obs_space{torch::full({3}, -10.f), torch::full({3}, 10.f)};
        gym::space::Box act_space{torch::tensor({-2.f, -1.f}), torch::tensor({2.f, 1.f})};
        TD3Config config;
        std::shared_ptr<TD3Agent> agent;
    };
}

TEST_F(TD3Test, learn_below_threshold_is_noop) {
    EXPECT_EQ(agent->min_replay_size(), 40);
    fill(39);
    auto before = snapshot(*agent);
    EXPECT_FALSE(agent->learn());
    EXPECT_TRUE(unchanged(*agent, before));
    EXPECT_EQ(agent->get_buffer().size(), 39);
    EXPECT_EQ(agent->get_learn_step_counter(), 0);
}

TEST_F(TD3Test, delayed_actor_update) {
    fill(40);
    auto actor = snapshot(*agent->get_policy_network());
    auto target_actor = snapshot(*agent->get_target_policy_network());
    auto critic = snapshot(*agent->get_q_network());
    auto target_critic = snapshot(*agent->get_target_q_network());

    ASSERT_TRUE(agent->learn());
    EXPECT_EQ(agent->get_learn_step_counter(), 1);
    EXPECT_FALSE(unchanged(*agent->get_q_network(), critic));
    EXPECT_TRUE(unchanged(*agent->get_policy_network(), actor));
    EXPECT_TRUE(unchanged(*agent->get_target_policy_network(), target_actor));
    EXPECT_TRUE(unchanged(*agent->get_target_q_network(), target_critic));

    ASSERT_TRUE(agent->learn());
    EXPECT_EQ(agent->get_learn_step_counter(), 2);
    EXPECT_FALSE(unchanged(*agent->get_policy_network(), actor));
    EXPECT_FALSE(unchanged(*agent->get_target_policy_network(), target_actor));
    EXPECT_FALSE(unchanged(*agent->get_target_q_network(), target_critic));
}

TEST_F(TD3Test, train_step_reports_losses) {
    auto obs = torch::randn({4, 3});
    auto act = torch::rand({4, 2}) * 2 - 1;
    auto info = agent->train_step(obs, act, torch::randn({4, 3}), torch::randn({4}), torch::zeros({4}));
    EXPECT_TRUE(info.contains("LossQ"));
    EXPECT_FALSE(info.contains("LossPi"));
    info = agent->train_step(obs, act, torch::randn({4, 3}), torch::randn({4}), torch::zeros({4}));
    EXPECT_TRUE(info.contains("LossPi"));
}

TEST_F(TD3Test, actions_within_bounds) {
    config.warmup = 5;
    agent = std::make_shared<TD3Agent>(obs_space, act_space, config);
    auto low = act_space.get_low();
    auto high = act_space.get_high();
    for (int i = 0; i < 20; i++) {
        auto obs = torch::randn({3}) * 10;
        for (bool exploration: {true, false}) {
            auto act = agent->act_single(obs, exploration);
            ASSERT_EQ(act.sizes(), torch::IntArrayRef({2}));
            EXPECT_TRUE(torch::all(act >= low).item<bool>());
            EXPECT_TRUE(torch::all(act <= high).item<bool>());
        }
    }
}

TEST_F(TD3Test, target_q_ignores_next_state_when_done) {
    auto rew = torch::tensor({1.f, -2.f, 0.5f, 3.f});
    auto q_target = agent->compute_target_q(torch::randn({4, 3}), rew, torch::ones({4}));
    EXPECT_TRUE(torch::allclose(q_target, rew));
}

TEST_F(TD3Test, target_q_of_zero_target_critic_is_reward) {
    {
        torch::NoGradGuard no_grad;
        for (auto &p: agent->get_target_q_network()->parameters()) {
            p.zero_();
        }
    }
    auto rew = torch::tensor({1.f, -2.f, 0.5f, 3.f});
    auto q_target = agent->compute_target_q(torch::randn({4, 3}), rew, torch::zeros({4}));
    EXPECT_TRUE(torch::allclose(q_target, rew));
}

TEST_F(TD3Test, target_smoothing_stays_within_noise_clip) {
    config.target_noise = 10.f;
    config.noise_clip = 0.05f;
    agent = std::make_shared<TD3Agent>(obs_space, act_space, config);
    auto low = act_space.get_low();
    auto high = act_space.get_high();
    for (int i = 0; i < 10; i++) {
        auto next_obs = torch::randn({4, 3}) * 5;
        torch::Tensor deterministic;
        {
            torch::NoGradGuard no_grad;
            deterministic = agent->get_target_policy_network()->forward(next_obs);
        }
        auto smoothed = agent->smoothed_target_action(next_obs);
        ASSERT_EQ(smoothed.sizes(), deterministic.sizes());
        auto diff = torch::abs(smoothed - deterministic);
        EXPECT_LE(diff.max().item<float>(), config.noise_clip + 1e-6f);
        EXPECT_GT(diff.max().item<float>(), 0.f);
        EXPECT_TRUE(torch::all(smoothed >= low).item<bool>());
        EXPECT_TRUE(torch::all(smoothed <= high).item<bool>());
    }
}

TEST_F(TD3Test, warmup_ignores_actor) {
    config.warmup = 3;
    config.actor_noise = 0.f;
    agent = std::make_shared<TD3Agent>(obs_space, act_space, config);
    auto obs = torch::tensor({1.f, -2.f, 3.f});
    for (int i = 0; i < 3; i++) {
        EXPECT_TRUE(torch::equal(agent->act_single(obs, true), torch::zeros({2}))) << i;
    }

    torch::Tensor expected;
    {
        torch::NoGradGuard no_grad;
        expected = agent->get_policy_network()->forward(obs.unsqueeze(0)).index({0});
        expected = torch::max(torch::min(expected, act_space.get_high()), act_space.get_low());
    }
    auto act = agent->act_single(obs, true);
    EXPECT_TRUE(torch::allclose(act, expected));
    EXPECT_GT(torch::abs(act).sum().item<float>(), 0.f);
}

TEST_F(TD3Test, replay_smaller_than_min_replay_throws) {
    config.replay_size = 10 * config.batch_size - 1;
    EXPECT_THROW(std::make_shared<TD3Agent>(obs_space, act_space, config), std::invalid_argument);
    config.replay_size = 10 * config.batch_size;
    EXPECT_NO_THROW(std::make_shared<TD3Agent>(obs_space, act_space, config));
    config.batch_size = 0;
    EXPECT_THROW(std::make_shared<TD3Agent>(obs_space, act_space, config), std::invalid_argument);
}

TEST_F(TD3Test, checkpoint) {
    auto dir = fs::temp_directory_path() / "ccrl_td3_checkpoint";
    fs::remove_all(dir);
    fill(40);
    agent->learn();
    agent->learn();
    agent->save_checkpoint(dir.string());
    for (const auto &stem: {"actor", "target_actor", "critic", "target_critic"}) {
        EXPECT_TRUE(fs::exists(dir / "td3" / (std::string(stem) + ".pt"))) << stem;
    }

    torch::manual_seed(2);
    TD3Agent restored(obs_space, act_space, config);
    auto result = restored.load_checkpoint(dir.string());
    ASSERT_TRUE(result.success) << result.reason;
    EXPECT_TRUE(unchanged(restored, snapshot(*agent)));
    fs::remove_all(dir);
}
