#pragma once

#include "config/paper_trade_config.hpp"
#include "config/strategy_config.hpp"

#include <string>

namespace pmm {

struct AppConfig {
    StrategyConfig   strategy;
    PaperTradeConfig paper;
};

// Parses a JSON document. Absent keys keep their defaults, unknown keys are
// ignored. Throws std::invalid_argument on malformed JSON, a value of the wrong
// type, or a configuration that fails validation.
AppConfig parse_config(const std::string& text);

// Reads and parses `path`. A missing file yields the defaults with a warning.
AppConfig load_config(const std::string& path);

} // namespace pmm
