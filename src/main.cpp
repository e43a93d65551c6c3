#include "common/logger.hpp"
#include "config/config_loader.hpp"
#include "sim/paper_runner.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    std::string config_path = "data/config.json";
    bool synthetic = true;
    size_t num_ticks = 7200;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--ticks" && i + 1 < argc) {
            try {
                num_ticks = std::stoull(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --ticks value: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--data") {
            synthetic = false;
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto level = pmm::parse_log_level(argv[++i]);
            if (!level) {
                std::cerr << "Unknown log level: " << argv[i] << "\n";
                return 1;
            }
            pmm::Logger::instance().set_level(*level);
        } else if (arg == "--help") {
            std::cout << "Usage: pmm_engine [options]\n"
                      << "  --config <path>     Config file (default: data/config.json)\n"
                      << "  --ticks <n>         Number of synthetic book updates (default: 7200)\n"
                      << "  --data              Replay paper.data_file instead of synthetic data\n"
                      << "  --log-level <lvl>   debug, info, warn or error (default: info)\n"
                      << "  --help              Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << " (see --help)\n";
            return 1;
        }
    }

    pmm::AppConfig config;
    try {
        std::cout << "Loading config from: " << config_path << "\n";
        config = pmm::load_config(config_path);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    pmm::PaperRunner runner(config);
    pmm::PaperReport report;

    try {
        if (synthetic) {
            std::cout << "Running synthetic paper session with " << num_ticks << " book updates on "
                      << config.strategy.trading_pair << "...\n";
            report = runner.run_synthetic(num_ticks);
        } else {
            std::cout << "Replaying book data from: " << config.paper.data_file << "\n";
            report = runner.run();
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Paper session failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n" << report.summary();
    return 0;
}
