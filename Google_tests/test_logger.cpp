#include "gtest/gtest.h"
#include "logger.h"

#include <filesystem>
#include <fstream>

using namespace ccrl::logger;
namespace fs = std::filesystem;

TEST(logger, epoch_statistics) {
    EpochLogger logger;
    logger.store("EpRet", std::vector<float>{1.f, 2.f, 3.f});
    logger.store("EpRet", 6.f);
    auto stats = logger.get_stats("EpRet", true, false);
    EXPECT_FLOAT_EQ(stats.at("Average"), 3.f);
    EXPECT_FLOAT_EQ(stats.at("Min"), 1.f);
    EXPECT_FLOAT_EQ(stats.at("Max"), 6.f);
    EXPECT_NEAR(stats.at("Std"), std::sqrt(3.5f), 1e-5);

    logger.log_tabular("EpRet", std::nullopt, true);
    // the values are consumed by log_tabular
    EXPECT_TRUE(logger.get("EpRet").empty());
    logger.dump_tabular();
}

TEST(logger, progress_file) {
    auto dir = fs::temp_directory_path() / "ccrl_logger_test";
    fs::remove_all(dir);
    auto output_dir = setup_logger_kwargs("exp", 3, dir.string());
    EXPECT_EQ(output_dir, (dir / "exp" / "exp_s3").string());
    {
        EpochLogger logger(output_dir, "exp");
        nlohmann::json config{{"seed", 3}};
        logger.save_config(config);
        for (int epoch = 1; epoch <= 2; epoch++) {
            logger.store("LossQ", static_cast<float>(epoch));
            logger.log_tabular("Epoch", static_cast<float>(epoch));
            logger.log_tabular("LossQ", std::nullopt, false, true);
            logger.dump_tabular();
        }
    }
    std::ifstream progress(fs::path(output_dir) / "progress.txt");
    std::string header, row1, row2;
    std::getline(progress, header);
    std::getline(progress, row1);
    std::getline(progress, row2);
    EXPECT_EQ(header, "Epoch\tAverageLossQ");
    EXPECT_EQ(row1, "1\t1");
    EXPECT_EQ(row2, "2\t2");

    std::ifstream config_file(fs::path(output_dir) / "config.json");
    auto config = nlohmann::json::parse(config_file);
    EXPECT_EQ(config.at("seed"), 3);
    EXPECT_EQ(config.at("exp_name"), "exp");
    fs::remove_all(dir);
}

TEST(logger, key_misuse) {
    EpochLogger logger;
    logger.log_tabular("Epoch", 1.f);
    EXPECT_THROW(logger.log_tabular("Epoch", 2.f), std::runtime_error);
    logger.dump_tabular();
    EXPECT_THROW(logger.log_tabular("Time", 1.f), std::runtime_error);
    // a row with a missing key can't be dumped
    EXPECT_THROW(logger.dump_tabular(), std::runtime_error);
}
