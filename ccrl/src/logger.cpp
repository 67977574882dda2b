#include "logger.h"
#include "spdlog/spdlog.h"
#include "fmt/ranges.h"

#include <algorithm>
#include <cmath>


namespace ccrl::logger {

    // Average, plus Std unless average_only, plus Min and Max when requested
    static std::map<std::string, float> summarize(const std::vector<float> &values, bool with_min_and_max,
                                                  bool average_only) {
        if (values.empty()) {
            throw std::runtime_error("Can't compute statistics of an empty vector");
        }
        double sum = 0, sq_sum = 0;
        float min_val = values.front(), max_val = values.front();
        for (float v: values) {
            sum += v;
            sq_sum += (double) v * v;
            min_val = std::min(min_val, v);
            max_val = std::max(max_val, v);
        }
        double mean = sum / (double) values.size();
        std::map<std::string, float> stats{{"Average", (float) mean}};
        if (!average_only) {
            stats["Std"] = (float) std::sqrt(std::max(sq_sum / (double) values.size() - mean * mean, 0.));
        }
        if (with_min_and_max) {
            stats["Min"] = min_val;
            stats["Max"] = max_val;
        }
        return stats;
    }

    std::string setup_logger_kwargs(const std::string &exp_name, int64_t seed, const std::string &data_dir) {
        return (fs::path(data_dir) / exp_name / fmt::format("{}_s{}", exp_name, seed)).string();
    }

    Logger::Logger(const std::string &output_dir, std::string exp_name, const std::string &output_fname) :
            m_output_dir(output_dir),
            m_exp_name(std::move(exp_name)) {
        if (output_dir.empty()) {
            return;
        }
        if (fs::exists(output_dir)) {
            spdlog::warn("Log dir {} already exists! Storing info there anyway.", output_dir);
        } else {
            fs::create_directories(output_dir);
        }
        auto file_name = (fs::path(output_dir) / output_fname).string();
        spdlog::info("Logging data to {}", file_name);
        m_output_file.open(file_name, std::fstream::out);
        if (!m_output_file.is_open()) {
            throw std::runtime_error(fmt::format("Can't open {} for writing", file_name));
        }
    }

    Logger::~Logger() = default;

    void Logger::save_config(json &root) {
        if (!m_exp_name.empty()) {
            root["exp_name"] = m_exp_name;
        }
        auto output = root.dump(4);
        spdlog::info("Saving config:\n{}", output);
        if (m_output_dir.empty()) {
            return;
        }
        auto file_name = fs::path(m_output_dir) / "config.json";
        std::ofstream f(file_name);
        if (!f.is_open()) {
            throw std::runtime_error(fmt::format("Can't open {} for writing", file_name.string()));
        }
        f << output;
    }

    void Logger::log_tabular(const std::string &key, float val) {
        bool known = std::find(m_log_headers.begin(), m_log_headers.end(), key) != m_log_headers.end();
        if (!m_first_row && !known) {
            throw std::runtime_error(
                    fmt::format("Trying to introduce a new key {} that you didn't include in the first iteration",
                                key));
        }
        if (m_log_current_row.contains(key)) {
            throw std::runtime_error(
                    fmt::format("You already set {} this iteration. Maybe you forgot to call dump_tabular()", key));
        }
        if (!known) {
            m_log_headers.push_back(key);
        }
        m_log_current_row[key] = val;
    }

    void Logger::dump_tabular() {
        std::vector<float> row;
        for (const auto &key: m_log_headers) {
            auto it = m_log_current_row.find(key);
            if (it == m_log_current_row.end()) {
                throw std::runtime_error(fmt::format("Key {} is missing in this iteration", key));
            }
            row.push_back(it->second);
        }

        if (m_first_row) {
            m_key_width = 15;
            for (const auto &key: m_log_headers) {
                m_key_width = std::max(m_key_width, key.size());
            }
            if (m_output_file.is_open()) {
                m_output_file << fmt::format("{}\n", fmt::join(m_log_headers, "\t"));
            }
        }

        std::string separator(m_key_width + 22, '-');
        std::string table = separator + "\n";
        for (size_t i = 0; i < row.size(); i++) {
            table += fmt::format("| {:>{}} | {:>15} |\n", m_log_headers[i], m_key_width, fmt::format("{:8.3g}", row[i]));
        }
        table += separator + "\n";
        fmt::print("{}", table);

        if (m_output_file.is_open()) {
            m_output_file << fmt::format("{}\n", fmt::join(row, "\t"));
            m_output_file.flush();
        }

        m_log_current_row.clear();
        m_first_row = false;
    }

    const std::string &Logger::get_output_dir() const {
        return m_output_dir;
    }

    void EpochLogger::store(const std::string &name, const std::vector<float> &data) {
        auto &values = m_epoch_dict[name];
        values.insert(values.end(), data.begin(), data.end());
    }

    void EpochLogger::store(const std::string &name, float data) {
        m_epoch_dict[name].push_back(data);
    }

    void EpochLogger::store(const std::map<std::string, std::vector<float>> &data) {
        for (const auto &it: data) {
            store(it.first, it.second);
        }
    }

    void EpochLogger::log_tabular(const std::string &key, std::optional<float> val, bool with_min_and_max,
                                  bool average_only) {
        if (val != std::nullopt) {
            Logger::log_tabular(key, val.value());
            return;
        }
        auto &values = m_epoch_dict[key];
        // nothing stored this epoch, e.g. the agent has not started updating yet
        auto stats = values.empty() ? summarize({0.f}, with_min_and_max, average_only)
                                    : summarize(values, with_min_and_max, average_only);
        for (const auto &it: stats) {
            Logger::log_tabular(it.first + key, it.second);
        }
        values.clear();
    }

    std::vector<float> EpochLogger::get(const std::string &key) const {
        return m_epoch_dict.at(key);
    }

    std::map<std::string, float>
    EpochLogger::get_stats(const std::string &key, bool with_min_and_max, bool average_only) const {
        return summarize(m_epoch_dict.at(key), with_min_and_max, average_only);
    }

}
