#include "gtest/gtest.h"
#include "nn/actor.h"
#include "nn/value_net.h"
#include "utils/torch_utils.h"

using namespace ccrl::nn;

TEST(NN, ensemble_q_network) {
    torch::manual_seed(1);
    EnsembleMinQNet q(3, 2, 16);
    auto obs = torch::randn({7, 3});
    auto act = torch::randn({7, 2});
    auto all = q->forward(obs, act, false);
    auto reduced = q->forward(obs, act, true);
    ASSERT_EQ(all.sizes(), torch::IntArrayRef({2, 7}));
    ASSERT_EQ(reduced.sizes(), torch::IntArrayRef({7}));
    EXPECT_TRUE(torch::equal(reduced, std::get<0>(torch::min(all, 0))));
    // the two members are initialized independently
    EXPECT_FALSE(torch::allclose(all[0], all[1]));
}

TEST(NN, deterministic_actor_bounds) {
    torch::manual_seed(1);
    auto low = torch::tensor({-2.f, 0.f});
    auto high = torch::tensor({2.f, 1.f});
    DeterministicActor actor(3, low, high, 16);
    auto act = actor->forward(torch::randn({64, 3}) * 100);
    ASSERT_EQ(act.sizes(), torch::IntArrayRef({64, 2}));
    EXPECT_TRUE(torch::all(act >= low).item<bool>());
    EXPECT_TRUE(torch::all(act <= high).item<bool>());
}

TEST(NN, gaussian_actor_std_range) {
    torch::manual_seed(1);
    GaussianActor actor(3, 2, 16);
    auto [mean, stddev] = actor->forward(torch::randn({64, 3}) * 1000);
    ASSERT_EQ(mean.sizes(), torch::IntArrayRef({64, 2}));
    ASSERT_EQ(stddev.sizes(), torch::IntArrayRef({64, 2}));
    EXPECT_TRUE(torch::all(stddev >= std::exp(GaussianActorImpl::LOG_STD_MIN) * 0.999).item<bool>());
    EXPECT_TRUE(torch::all(stddev <= std::exp(GaussianActorImpl::LOG_STD_MAX) * 1.001).item<bool>());
}

TEST(NN, build_mlp) {
    auto mlp = build_mlp(4, 1, 8, 1, "relu", true, "tanh");
    auto out = mlp->forward(torch::randn({5, 4}) * 100);
    ASSERT_EQ(out.sizes(), torch::IntArrayRef({5}));
    EXPECT_TRUE(torch::all(torch::abs(out) <= 1).item<bool>());

    EXPECT_THROW(build_mlp(4, 1, 8, 0), std::invalid_argument);
    EXPECT_THROW(Activation("swish"), std::runtime_error);
}

TEST(NN, torch_device) {
    EXPECT_EQ(ccrl::ptu::get_torch_device("cpu").type(), torch::kCPU);
    auto gpu = ccrl::ptu::get_torch_device("gpu");
    EXPECT_EQ(gpu.type(), torch::cuda::is_available() ? torch::kCUDA : torch::kCPU);
    EXPECT_THROW(ccrl::ptu::get_torch_device("tpu"), std::runtime_error);
}
