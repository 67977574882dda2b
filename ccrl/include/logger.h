#ifndef CCRL_LOGGER_H
#define CCRL_LOGGER_H

#include <string>
#include <fstream>
#include <filesystem>
#include <map>
#include <utility>
#include <vector>
#include <numeric>
#include <optional>
#include "nlohmann/json.hpp"
#include "fmt/format.h"


namespace ccrl::logger {
    namespace fs = std::filesystem;
    using json = nlohmann::json;

    // output_dir = data_dir/exp_name/exp_name_s[seed]
    std::string setup_logger_kwargs(const std::string &exp_name, int64_t seed, const std::string &data_dir);

    /*
     * Tabular progress logger. Every row must contain exactly the keys of the first row. Rows are printed to the
     * console and, when an output directory is given, appended to a tab separated file.
     */
    class Logger {
    public:
        explicit Logger(const std::string &output_dir = {}, std::string exp_name = {},
                        const std::string &output_fname = "progress.txt");

        virtual ~Logger();

        void save_config(json &root);

        void log_tabular(const std::string &key, float val);

        virtual void dump_tabular();

        [[nodiscard]] const std::string &get_output_dir() const;

    protected:
        const std::string m_output_dir;
        std::ofstream m_output_file;
        bool m_first_row = true;
        // column order, fixed by the first row
        std::vector<std::string> m_log_headers;
        std::map<std::string, float> m_log_current_row;
        const std::string m_exp_name;
        // width of the key column in the console table
        size_t m_key_width{};
    };

    /*
     * Accumulates values during an epoch and logs their statistics at the end of it.
     */
    class EpochLogger final : public Logger {
        using Logger::Logger;
    public:
        void store(const std::string &name, const std::vector<float> &data);

        void store(const std::string &name, float data);

        void store(const std::map<std::string, std::vector<float>> &data);

        // with val == nullopt, logs Average (and Std, Min, Max) of the values stored under key and clears them
        void log_tabular(const std::string &key, std::optional<float> val, bool with_min_and_max = false,
                         bool average_only = false);

        std::vector<float> get(const std::string &key) const;

        std::map<std::string, float> get_stats(const std::string &key, bool with_min_and_max, bool average_only) const;

    protected:
        std::map<std::string, std::vector<float>> m_epoch_dict;
    };

}

#endif //CCRL_LOGGER_H
