#include "pairs/analysis/signal_evaluator.hpp"
#include "pairs/signal/entry_rule.hpp"

namespace pairs {

namespace {

double ratio(std::size_t num, std::size_t den) {
  return den > 0 ? static_cast<double>(num) / static_cast<double>(den) : 0.0;
}

}  // namespace

std::vector<SignalEvaluation> evaluateSignals(
    const SignalStream& stream, const BacktestConfig& config,
    const std::vector<StrategyVariant>& variants) {
  ValidationRequirements req;
  for (const auto& v : variants) {
    req.models.insert(req.models.end(), v.models.begin(), v.models.end());
  }
  stream.validate(req);

  std::vector<SignalEvaluation> out;
  out.reserve(variants.size());

  for (const auto& variant : variants) {
    std::vector<std::size_t> indices;
    for (const auto& m : variant.models) {
      indices.push_back(static_cast<std::size_t>(stream.modelIndex(m)));
    }
    const EntryRule rule(config.entry_z_threshold, config.model_confidence,
                         indices);

    SignalEvaluation e;
    e.name = variant.name;
    std::size_t long_wins = 0;
    std::size_t short_wins = 0;

    for (const auto& row : stream.rows()) {
      const auto direction = rule.evaluate(row);
      if (!direction) {
        continue;
      }
      if (*direction == domain::Direction::Long) {
        ++e.long_trades;
        if (row.target_direction == 1) ++long_wins;
      } else {
        ++e.short_trades;
        if (row.target_direction == 0) ++short_wins;
      }
    }

    e.total_trades = e.long_trades + e.short_trades;
    e.win_rate = ratio(long_wins + short_wins, e.total_trades);
    e.long_win_rate = ratio(long_wins, e.long_trades);
    e.short_win_rate = ratio(short_wins, e.short_trades);
    out.push_back(e);
  }
  return out;
}

}  // namespace pairs
