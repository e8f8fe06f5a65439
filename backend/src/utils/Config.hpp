#pragma once
#include <string>
#include "../core/SchedulerParams.hpp"

struct LogConfig {
    std::string file = "retain.log"; // empty = colour console
    std::string level = "debug";
};

struct StorageConfig {
    std::string data_dir = "retain-data";
    std::string key = "retain_srs";
    bool encrypt = false;
    bool async_persist = true;
};

struct AppConfig {
    SchedulerParams scheduler;
    std::size_t session_max_cards = 20;
    StorageConfig storage;
    LogConfig log;
};

/*
  "key = value" configuration, '#' starts a comment.
  Unknown keys and bad values are logged and skipped; defaults stay.
*/
namespace Config
{
    AppConfig parse(const std::string& text);

    // Missing file yields the defaults.
    AppConfig loadFile(const std::string& path);
}
