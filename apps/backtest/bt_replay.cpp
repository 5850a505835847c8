#include <iostream>
#include <string>
#include "line_ngin/backtest/backtest_runner.hpp"
#include "line_ngin/core/logger.hpp"
#include "line_ngin/core/time_utils.hpp"
#include "line_ngin/data/dataset_loader.hpp"
#include "line_ngin/data/record_codec.hpp"
#include "line_ngin/optimization/parameter_optimizer.hpp"
#include "line_ngin/statistics/calibrator.hpp"

using namespace line_ngin;
using namespace line_ngin::backtest;

namespace {

void print_usage() {
    std::cerr << "Usage: bt_replay <dataset.json> [report.json] [--no-optimize] [--weather]"
              << " [--apply-calibration] [--optimizer-config <file>]"
              << " [--backtest-config <file>]" << std::endl;
}

void print_tally(const std::string& label, const OutcomeTally& tally) {
    if (tally.total_graded() == 0) {
        return;
    }
    std::cout << "  " << label << ": " << tally.wins << "-" << tally.losses << "-"
              << tally.pushes << " (" << tally.win_pct() << "%)" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::string dataset_path;
        std::string report_path = "bt_replay_report.json";
        std::string optimizer_config_path;
        std::string backtest_config_path;
        bool run_optimizer = true;
        bool weather_search = false;
        bool use_calibration = false;

        int positional = 0;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-optimize") {
                run_optimizer = false;
            } else if (arg == "--weather") {
                weather_search = true;
            } else if (arg == "--apply-calibration") {
                use_calibration = true;
            } else if (arg == "--optimizer-config" && i + 1 < argc) {
                optimizer_config_path = argv[++i];
            } else if (arg == "--backtest-config" && i + 1 < argc) {
                backtest_config_path = argv[++i];
            } else if (!arg.empty() && arg[0] == '-') {
                print_usage();
                return 1;
            } else if (positional == 0) {
                dataset_path = arg;
                positional++;
            } else if (positional == 1) {
                report_path = arg;
                positional++;
            } else {
                print_usage();
                return 1;
            }
        }
        if (dataset_path.empty()) {
            print_usage();
            return 1;
        }

        // Initialize logger
        Logger::reset_for_tests();
        auto& logger = Logger::instance();
        LoggerConfig logger_config;
        logger_config.min_level = LogLevel::INFO;
        logger_config.destination = LogDestination::BOTH;
        logger_config.log_directory = "logs";
        logger_config.filename_prefix = "bt_replay";
        logger.initialize(logger_config);

        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("bt_replay");

        auto dataset_result = DatasetLoader::load_file(dataset_path);
        if (dataset_result.is_error()) {
            std::cerr << "Failed to load dataset: " << dataset_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        const Dataset& dataset = dataset_result.value();

        BacktestConfig config = BacktestConfig::for_sport(dataset.sport);
        if (!backtest_config_path.empty()) {
            auto load_result = config.load_from_file(backtest_config_path);
            if (load_result.is_error()) {
                std::cerr << "Failed to load backtest config: "
                          << load_result.error()->to_string() << std::endl;
                return 1;
            }
        }
        // Calibration from a ratings-only pass
        auto samples_result = BacktestRunner(config).collect_rating_samples(dataset.games);
        if (samples_result.is_error()) {
            std::cerr << "Calibration failed: " << samples_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        statistics::Calibrator calibrator;
        statistics::CalibrationResult calibration = calibrator.calibrate(samples_result.value());

        if (use_calibration) {
            auto calibrated = statistics::apply_calibration(calibration, config.params);
            if (calibrated.is_error()) {
                std::cerr << "Cannot apply calibration: " << calibrated.error()->to_string()
                          << std::endl;
                return 1;
            }
            config.params = calibrated.value();
            INFO("Replaying with calibrated rating_to_points " << config.params.rating_to_points
                                                               << ", home_advantage "
                                                               << config.params.home_advantage);
        }

        // Historical replay with the production or calibrated model
        BacktestRunner runner(config);
        auto backtest_result = runner.run(dataset.games, dataset.teams, dataset.lines);
        if (backtest_result.is_error()) {
            std::cerr << "Backtest failed: " << backtest_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        const BacktestReport& report = backtest_result.value();

        std::cout << to_string(dataset.sport) << " backtest: " << report.results.size()
                  << " graded games" << std::endl;
        print_tally("spread (market)", report.summary.spread.market);
        print_tally("spread (model)", report.summary.spread.model);
        print_tally("moneyline", report.summary.moneyline.model);
        print_tally("total (market)", report.summary.total.market);
        print_tally("total (baseline)", report.summary.total.baseline);
        print_tally("high-conviction spread", report.summary.high_conviction_spread.market);

        nlohmann::json output;
        output["generated_at"] = core::to_iso8601(std::chrono::system_clock::now());
        output["sport"] = to_string(dataset.sport);
        output["config"] = config.to_json();
        output["calibration"] = statistics::to_json(calibration);
        output["calibration"]["applied"] = use_calibration;
        output["summary"] = to_json(report.summary);
        output["results"] = nlohmann::json::array();
        for (const auto& result : report.results) {
            output["results"].push_back(codec::encode(result));
        }

        if (run_optimizer) {
            optimization::OptimizerConfig optimizer_config;
            if (!optimizer_config_path.empty()) {
                auto load_result = optimizer_config.load_from_file(optimizer_config_path);
                if (load_result.is_error()) {
                    std::cerr << "Failed to load optimizer config: "
                              << load_result.error()->to_string() << std::endl;
                    return 1;
                }
            }

            optimization::ParameterOptimizer optimizer(config.profile, optimizer_config);
            auto space = weather_search ? optimization::ParameterSpace::weather_search_plan()
                                        : optimization::ParameterSpace::default_search_plan();
            auto optimization_result =
                optimizer.optimize(dataset.games, dataset.teams, dataset.lines, config.params,
                                   space);
            if (optimization_result.is_error()) {
                std::cerr << "Optimization failed: "
                          << optimization_result.error()->to_string() << std::endl;
                return 1;
            }
            const auto& search = optimization_result.value();
            output["optimization"] = optimization::to_json(search);

            std::cout << "Optimizer: " << search.total_simulations << " simulations, "
                      << search.top.size() << " distinct configurations" << std::endl;
            if (search.best_by_profit) {
                std::cout << "  best by profit: " << search.best_by_profit->profit
                          << " (" << search.best_by_profit->win_pct << "% over "
                          << search.best_by_profit->total_graded << " bets)" << std::endl;
            }
        }

        auto write_result = DatasetLoader::write_json(report_path, output);
        if (write_result.is_error()) {
            std::cerr << "Failed to write report: " << write_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        INFO("Report written to " << report_path);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
