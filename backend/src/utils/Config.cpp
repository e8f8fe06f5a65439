#include "Config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>

namespace
{
    std::string trim(const std::string& s) {
        std::size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    }

    // Whole-string numeric parse; trailing junk is an error.
    double toDouble(const std::string& v) {
        std::size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size()) throw std::invalid_argument("trailing characters");
        return d;
    }

    int toInt(const std::string& v) {
        std::size_t used = 0;
        int i = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument("trailing characters");
        return i;
    }

    bool toBool(const std::string& v) {
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
        throw std::invalid_argument("not a boolean");
    }

    template <typename T, typename Fn>
    std::vector<T> toList(const std::string& v, Fn convert) {
        std::vector<T> out;
        std::istringstream iss(v);
        std::string item;
        while (std::getline(iss, item, ',')) {
            item = trim(item);
            if (!item.empty()) out.push_back(convert(item));
        }
        return out;
    }

    int positive(int v) {
        if (v <= 0) throw std::out_of_range("must be positive");
        return v;
    }

    using Setter = std::function<void(AppConfig&, const std::string&)>;

    const std::unordered_map<std::string, Setter>& setters() {
        static const std::unordered_map<std::string, Setter> table = {
            { "weights", [](AppConfig& c, const std::string& v) {
                auto w = toList<double>(v, toDouble);
                if (w.size() != SchedulerParams::WEIGHT_COUNT)
                    throw std::invalid_argument("expected 17 weights");
                std::copy(w.begin(), w.end(), c.scheduler.w.begin());
            } },
            { "request_retention", [](AppConfig& c, const std::string& v) {
                double r = toDouble(v);
                if (r <= 0.0 || r >= 1.0) throw std::out_of_range("retention must be in (0,1)");
                c.scheduler.request_retention = r;
            } },
            { "maximum_interval", [](AppConfig& c, const std::string& v) {
                c.scheduler.maximum_interval = positive(toInt(v));
            } },
            { "learning_steps", [](AppConfig& c, const std::string& v) {
                auto steps = toList<int>(v, [](const std::string& s) { return positive(toInt(s)); });
                if (steps.empty()) throw std::invalid_argument("empty step list");
                c.scheduler.learning_steps = steps;
            } },
            { "relearning_steps", [](AppConfig& c, const std::string& v) {
                auto steps = toList<int>(v, [](const std::string& s) { return positive(toInt(s)); });
                if (steps.empty()) throw std::invalid_argument("empty step list");
                c.scheduler.relearning_steps = steps;
            } },
            { "graduating_interval", [](AppConfig& c, const std::string& v) {
                c.scheduler.graduating_interval = positive(toInt(v));
            } },
            { "easy_interval", [](AppConfig& c, const std::string& v) {
                c.scheduler.easy_interval = positive(toInt(v));
            } },
            { "graduation_consecutive", [](AppConfig& c, const std::string& v) {
                c.scheduler.graduation_consecutive = positive(toInt(v));
            } },
            { "graduation_min_interval", [](AppConfig& c, const std::string& v) {
                c.scheduler.graduation_min_interval = toDouble(v);
            } },
            { "reactivation_lapse_threshold", [](AppConfig& c, const std::string& v) {
                c.scheduler.reactivation_lapse_threshold = positive(toInt(v));
            } },
            { "reactivation_window_days", [](AppConfig& c, const std::string& v) {
                c.scheduler.reactivation_window_days = positive(toInt(v));
            } },
            { "reactivation_max_siblings", [](AppConfig& c, const std::string& v) {
                c.scheduler.reactivation_max_siblings = static_cast<std::size_t>(positive(toInt(v)));
            } },
            { "max_error_history", [](AppConfig& c, const std::string& v) {
                c.scheduler.max_error_history = static_cast<std::size_t>(positive(toInt(v)));
            } },
            { "session_max_cards", [](AppConfig& c, const std::string& v) {
                c.session_max_cards = static_cast<std::size_t>(positive(toInt(v)));
            } },
            { "data_dir", [](AppConfig& c, const std::string& v) {
                if (v.empty()) throw std::invalid_argument("empty path");
                c.storage.data_dir = v;
            } },
            { "storage_key", [](AppConfig& c, const std::string& v) {
                if (v.empty()) throw std::invalid_argument("empty key");
                c.storage.key = v;
            } },
            { "encrypt", [](AppConfig& c, const std::string& v) { c.storage.encrypt = toBool(v); } },
            { "async_persist", [](AppConfig& c, const std::string& v) { c.storage.async_persist = toBool(v); } },
            { "log_file", [](AppConfig& c, const std::string& v) { c.log.file = v; } },
            { "log_level", [](AppConfig& c, const std::string& v) {
                if (spdlog::level::from_str(v) == spdlog::level::off && v != "off")
                    throw std::invalid_argument("unknown log level");
                c.log.level = v;
            } },
        };
        return table;
    }
}

namespace Config
{
    AppConfig parse(const std::string& text) {
        AppConfig cfg;
        std::istringstream iss(text);
        std::string line;
        int lineNo = 0;

        while (std::getline(iss, line)) {
            ++lineNo;
            auto hash = line.find('#');
            if (hash != std::string::npos) line.erase(hash);
            line = trim(line);
            if (line.empty()) continue;

            auto eq = line.find('=');
            if (eq == std::string::npos) {
                spdlog::warn("Config line {}: expected 'key = value'", lineNo);
                continue;
            }

            std::string key = trim(line.substr(0, eq));
            std::string value = trim(line.substr(eq + 1));

            auto it = setters().find(key);
            if (it == setters().end()) {
                spdlog::warn("Config line {}: unknown key '{}'", lineNo, key);
                continue;
            }

            try {
                it->second(cfg, value);
            }
            catch (const std::exception& e) {
                spdlog::warn("Config line {}: bad value for '{}' ({}); keeping default", lineNo, key, e.what());
            }
        }

        return cfg;
    }

    AppConfig loadFile(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            spdlog::warn("Config file '{}' not found; using defaults", path);
            return AppConfig{};
        }
        std::stringstream ss;
        ss << in.rdbuf();
        spdlog::info("Loading config from '{}'", path);
        return parse(ss.str());
    }
}
