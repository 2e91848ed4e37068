// -----------------------------------------------------------------------------
// pairs_backtest — command-line entry point.
//
//   pairs_backtest <signals.csv> [--config <file.json>] [--report <out.json>]
//                  [--verbose]
//
//   1) Load the signal CSV into a SignalStream (columns are discovered from
//      the header; every "<Model>_Pred" column defines a model).
//   2) Load the run configuration, or use defaults: one variant per model
//      plus a "Hybrid" consensus over all models when there are several.
//   3) Run every variant through the EquityAggregator. With --verbose, each
//      engine's EventBus gets logging subscribers before it runs.
//   4) Print the configuration, one block per variant and the winner.
//   5) Optionally write the JSON report.
//
// Any ConfigError / SignalValidationError / BacktestError aborts with a
// message on stderr and exit code 1.
// -----------------------------------------------------------------------------

#include "pairs/analysis/performance_stats.hpp"
#include "pairs/analysis/signal_evaluator.hpp"
#include "pairs/config/config_loader.hpp"
#include "pairs/domain/errors.hpp"
#include "pairs/engine/equity_aggregator.hpp"
#include "pairs/events/event.hpp"
#include "pairs/events/event_types.hpp"
#include "pairs/report/report_writer.hpp"
#include "pairs/signal/signal_csv_loader.hpp"
#include "pairs/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CliOptions {
  std::string signals_path;
  std::optional<std::string> config_path;
  std::optional<std::string> report_path;
  bool verbose{false};
};

void printUsage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " <signals.csv> [--config <file.json>] [--report <out.json>]"
               " [--verbose]\n";
}

// Returns std::nullopt (after printing usage) on malformed arguments.
std::optional<CliOptions> parseArgs(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" || arg == "--report") {
      if (i + 1 >= argc) {
        std::cerr << "[main] ERROR: " << arg << " needs a file argument\n";
        return std::nullopt;
      }
      (arg == "--config" ? opts.config_path : opts.report_path) = argv[++i];
    } else if (arg == "--verbose") {
      opts.verbose = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "[main] ERROR: unknown option " << arg << "\n";
      return std::nullopt;
    } else if (opts.signals_path.empty()) {
      opts.signals_path = arg;
    } else {
      std::cerr << "[main] ERROR: unexpected argument " << arg << "\n";
      return std::nullopt;
    }
  }
  if (opts.signals_path.empty()) {
    return std::nullopt;
  }
  return opts;
}

std::vector<pairs::StrategyVariant> defaultVariants(
    const std::vector<std::string>& models) {
  std::vector<pairs::StrategyVariant> variants;
  for (const auto& m : models) {
    variants.push_back({m, {m}});
  }
  if (models.size() > 1) {
    variants.push_back({"Hybrid", models});
  }
  return variants;
}

void printConfig(const pairs::BacktestConfig& c) {
  std::cout << std::string(70, '=') << "\n"
            << "PAIRS TRADING BACKTEST\n"
            << std::string(70, '=') << "\n"
            << std::fixed << std::setprecision(2)
            << "Initial Capital:     $" << c.initial_capital << "\n";
  if (c.riskPct() > 0.0) {
    std::cout << "Position Risk:       " << c.riskPct() * 100.0
              << "% per trade\n";
  } else {
    std::cout << "Capital Per Trade:   $" << c.capital_per_trade << "\n";
  }
  std::cout << "Max Concurrent:      " << c.max_positions << " positions\n"
            << "Exit Policy:         "
            << pairs::exitPolicyKindToString(c.exit_policy) << "\n";
  if (c.exit_policy == pairs::ExitPolicyKind::SignalReversal) {
    std::cout << "Transaction Cost:    " << c.transaction_cost_pct * 100.0
              << "%\n"
              << "Entry / Exit |Z|:    " << c.entry_z_threshold << " / "
              << c.exit_z_threshold << "\n";
  } else {
    std::cout << "Commission:          $" << c.commission << "\n"
              << "Hold Period:         " << c.hold_period
              << " trading days\n"
              << "Entry |Z|:           " << c.entry_z_threshold << "\n";
  }
  std::cout << "Model Confidence:    " << c.model_confidence << "\n\n";
}

void printVariant(const pairs::VariantSummary& summary,
                  const pairs::PerformanceStats& p,
                  const pairs::SignalEvaluation* eval) {
  std::cout << "\n" << summary.name << "\n" << std::string(70, '-') << "\n";
  if (p.total_trades == 0) {
    std::cout << "No trades\n";
    return;
  }
  std::cout << std::fixed << std::setprecision(2)
            << "Final Equity:        $" << p.final_equity << "\n"
            << "Total Return:        " << std::showpos << p.total_return_pct
            << std::noshowpos << "%\n"
            << "Total PnL:           $" << p.total_pnl << "\n"
            << "Max Drawdown:        " << p.max_drawdown_pct << "%\n"
            << "\nTrades:              " << p.total_trades << "\n"
            << "Winning:             " << p.winning_trades << "\n"
            << "Losing:              " << p.losing_trades << "\n"
            << std::setprecision(1)
            << "Win Rate:            " << p.win_rate_pct << "%\n"
            << std::setprecision(2)
            << "Avg Win:             $" << p.avg_win << "\n"
            << "Avg Loss:            $" << p.avg_loss << "\n"
            << "Skipped Entries:     " << summary.skipped_entries << "\n";
  if (eval != nullptr) {
    std::cout << std::setprecision(1)
              << "Signal Win Rate:     " << eval->win_rate * 100.0 << "% ("
              << eval->total_trades << " signals, long "
              << eval->long_win_rate * 100.0 << "%, short "
              << eval->short_win_rate * 100.0 << "%)\n";
  }
}

// Attaches logging subscribers to one engine's bus. Under a parallel run the
// callbacks fire on worker threads, so output is serialized on `mu`.
void attachLoggers(const pairs::StrategyVariant& variant, pairs::EventBus& bus,
                   std::mutex& mu) {
  const std::string tag = "[" + variant.name + "] ";

  bus.subscribe<pairs::PositionOpenedEvent>(
      [tag, &mu](const pairs::PositionOpenedEvent& e) {
        std::lock_guard<std::mutex> lock(mu);
        std::cout << tag << pairs::format_date(e.trade.date) << " OPEN "
                  << pairs::domain::directionToString(e.trade.direction) << " "
                  << e.trade.pair_id << " capital=" << e.trade.invested_capital
                  << " cost=" << e.trade.cost << "\n";
      });

  bus.subscribe<pairs::PositionClosedEvent>(
      [tag, &mu](const pairs::PositionClosedEvent& e) {
        std::lock_guard<std::mutex> lock(mu);
        std::cout << tag << pairs::format_date(e.trade.date) << " CLOSE "
                  << e.trade.pair_id << " pnl=" << e.trade.realized_pnl
                  << " reason="
                  << (e.trade.close_reason
                          ? pairs::domain::closeReasonToString(
                                *e.trade.close_reason)
                          : "-")
                  << " available=" << e.available_capital << "\n";
      });

  bus.subscribe<pairs::EntrySkippedEvent>(
      [tag, &mu](const pairs::EntrySkippedEvent& e) {
        std::lock_guard<std::mutex> lock(mu);
        std::cout << tag << pairs::format_date(e.date) << " SKIP "
                  << pairs::domain::directionToString(e.direction) << " "
                  << e.pair_id << " reason="
                  << pairs::skipReasonToString(e.reason)
                  << " available=" << e.available_capital
                  << " required=" << e.required_capital << "\n";
      });
}

}  // namespace

int main(int argc, char** argv) {
  const auto opts = parseArgs(argc, argv);
  if (!opts) {
    printUsage(argv[0]);
    return 1;
  }

  try {
    // -----------------------------------------------------------------------
    // 1) Signals
    // -----------------------------------------------------------------------
    std::cout << "[main] Loading signals from " << opts->signals_path << "\n";
    const pairs::SignalStream stream =
        pairs::loadSignalCsvFile(opts->signals_path);
    std::cout << "[main] Loaded " << stream.size() << " rows, "
              << stream.modelNames().size() << " model(s)";
    if (!stream.empty()) {
      std::cout << ", " << pairs::format_date(stream.rows().front().date)
                << " to " << pairs::format_date(stream.rows().back().date);
    }
    std::cout << "\n";

    // -----------------------------------------------------------------------
    // 2) Configuration
    // -----------------------------------------------------------------------
    pairs::RunConfig run;
    if (opts->config_path) {
      run = pairs::loadRunConfig(*opts->config_path);
    }
    if (run.variants.empty()) {
      run.variants = defaultVariants(stream.modelNames());
    }
    if (run.variants.empty()) {
      throw pairs::ConfigError("no strategy variants and no *_Pred columns");
    }

    printConfig(run.backtest);

    // -----------------------------------------------------------------------
    // 3) Simulation
    // -----------------------------------------------------------------------
    pairs::EquityAggregator aggregator(run.backtest, run.variants,
                                       run.parallel);
    std::mutex log_mu;
    if (opts->verbose) {
      aggregator.setBusHook(
          [&log_mu](const pairs::StrategyVariant& v, pairs::EventBus& bus) {
            attachLoggers(v, bus, log_mu);
          });
    }

    const pairs::AggregateResult result = aggregator.run(stream);
    const auto evaluations =
        pairs::evaluateSignals(stream, run.backtest, run.variants);

    // -----------------------------------------------------------------------
    // 4) Results
    // -----------------------------------------------------------------------
    std::cout << std::string(70, '=') << "\n";
    for (std::size_t i = 0; i < result.summaries.size(); ++i) {
      const auto& run_result = result.runs[i];
      const auto stats = pairs::computePerformance(
          run_result.equity_curve, run_result.trades,
          run_result.initial_capital, run_result.final_equity);
      printVariant(result.summaries[i], stats, &evaluations[i]);
    }

    const auto& winner = result.summaries[pairs::winnerIndex(result)];
    std::cout << "\n" << std::string(70, '=') << "\n"
              << std::fixed << std::setprecision(2) << "WINNER: " << winner.name
              << " ($" << winner.final_equity - winner.initial_capital
              << ")\n"
              << std::string(70, '=') << "\n";

    // -----------------------------------------------------------------------
    // 5) Report
    // -----------------------------------------------------------------------
    if (opts->report_path) {
      pairs::writeReport(*opts->report_path, run.backtest, result,
                         evaluations);
      std::cout << "[main] Report written to " << *opts->report_path << "\n";
    }
  } catch (const pairs::SignalValidationError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  } catch (const pairs::ConfigError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[main] ERROR: malformed config: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
