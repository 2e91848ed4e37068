// =============================================================================
// signal_stream_test.cpp
// =============================================================================
// Unit tests for pairs::SignalStream: ordering, date slicing, lookups and
// validation errors (which carry date, pair and field).
// =============================================================================

#include "pairs/domain/errors.hpp"
#include "pairs/signal/signal_stream.hpp"
#include "pairs/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using pairs::make_date;

namespace {

pairs::domain::SignalRow makeRow(pairs::Date date, const std::string& pair,
                                 std::vector<double> preds = {0.6, 0.4}) {
  pairs::domain::SignalRow row;
  row.date = date;
  row.pair_id = pair;
  row.z_score = 0.0;
  row.spread_price = 1.0;
  row.predictions = std::move(preds);
  row.target_return = 0.01;
  row.target_direction = 1;
  return row;
}

const std::vector<std::string> kModels = {"Ridge", "LSTM"};

// Runs validate() and returns the field named by the error ("" if none).
std::string failingField(const pairs::SignalStream& s,
                         const pairs::ValidationRequirements& req = {}) {
  try {
    s.validate(req);
  } catch (const pairs::SignalValidationError& e) {
    return e.field();
  }
  return "";
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Rows are sorted by date; rows sharing a date keep their input order.
// -----------------------------------------------------------------------------
TEST(SignalStreamTest, StableSortAndSlices) {
  const auto d1 = make_date(2024, 1, 8);
  const auto d2 = make_date(2024, 1, 9);
  pairs::SignalStream s(kModels, {makeRow(d2, "X"), makeRow(d1, "B"),
                                  makeRow(d2, "Y"), makeRow(d1, "A")});

  ASSERT_EQ(s.size(), 4u);
  EXPECT_EQ(s.rows()[0].pair_id, "B");
  EXPECT_EQ(s.rows()[1].pair_id, "A");
  EXPECT_EQ(s.rows()[2].pair_id, "X");
  EXPECT_EQ(s.rows()[3].pair_id, "Y");

  ASSERT_EQ(s.slices().size(), 2u);
  EXPECT_EQ(s.slices()[0].date, d1);
  EXPECT_EQ(s.slices()[0].begin, 0u);
  EXPECT_EQ(s.slices()[0].end, 2u);
  EXPECT_EQ(s.slices()[1].date, d2);
  EXPECT_EQ(s.slices()[1].begin, 2u);
  EXPECT_EQ(s.slices()[1].end, 4u);
}

TEST(SignalStreamTest, LookupHelpers) {
  const auto d1 = make_date(2024, 1, 8);
  pairs::SignalStream s(kModels, {makeRow(d1, "A"), makeRow(d1, "B")});

  EXPECT_EQ(s.modelIndex("Ridge"), 0);
  EXPECT_EQ(s.modelIndex("LSTM"), 1);
  EXPECT_EQ(s.modelIndex("GBM"), -1);

  const auto& slice = s.slices().front();
  ASSERT_NE(s.rowFor(slice, "B"), nullptr);
  EXPECT_EQ(s.rowFor(slice, "B")->pair_id, "B");
  EXPECT_EQ(s.rowFor(slice, "Z"), nullptr);
}

// -----------------------------------------------------------------------------
// 2. A prediction vector that does not match the model list is rejected at
//    construction.
// -----------------------------------------------------------------------------
TEST(SignalStreamTest, PredictionCountMismatchThrows) {
  EXPECT_THROW(pairs::SignalStream(kModels, {makeRow(0, "A", {0.5})}),
               pairs::SignalValidationError);
}

// -----------------------------------------------------------------------------
// 3. Base validation: pair id, duplicates, prediction range, direction.
// -----------------------------------------------------------------------------
TEST(SignalStreamTest, BaseValidation) {
  const auto d1 = make_date(2024, 1, 8);

  EXPECT_EQ(failingField(pairs::SignalStream(kModels, {makeRow(d1, "A")})), "");

  EXPECT_EQ(failingField(pairs::SignalStream(kModels, {makeRow(d1, "")})),
            "Pair_ID");

  EXPECT_EQ(failingField(pairs::SignalStream(
                kModels, {makeRow(d1, "A"), makeRow(d1, "A")})),
            "Pair_ID");

  EXPECT_EQ(failingField(pairs::SignalStream(
                kModels, {makeRow(d1, "A", {0.5, 1.2})})),
            "LSTM_Pred");

  auto bad_dir = makeRow(d1, "A");
  bad_dir.target_direction = 2;
  EXPECT_EQ(failingField(pairs::SignalStream(kModels, {bad_dir})),
            "Target_Direction");
}

// -----------------------------------------------------------------------------
// 4. Mode-specific requirements and unknown models.
// -----------------------------------------------------------------------------
TEST(SignalStreamTest, RequirementValidation) {
  const auto d1 = make_date(2024, 1, 8);

  // A missing or zero spread is a no-action day, never a validation error.
  auto no_spread = makeRow(d1, "A");
  no_spread.spread_price = std::numeric_limits<double>::quiet_NaN();
  auto zero_spread = makeRow(d1, "B");
  zero_spread.spread_price = 0.0;
  pairs::ValidationRequirements outcome_only;
  outcome_only.require_targets = true;
  EXPECT_EQ(failingField(pairs::SignalStream(kModels, {no_spread, zero_spread})),
            "");
  EXPECT_EQ(failingField(pairs::SignalStream(kModels, {no_spread, zero_spread}),
                         outcome_only),
            "");

  auto no_target = makeRow(d1, "A");
  no_target.target_return = std::numeric_limits<double>::quiet_NaN();
  pairs::ValidationRequirements outcome;
  outcome.require_targets = true;
  EXPECT_EQ(failingField(pairs::SignalStream(kModels, {no_target}), outcome),
            "Target_Return");

  pairs::ValidationRequirements models;
  models.models = {"Ridge", "GBM"};
  EXPECT_EQ(failingField(pairs::SignalStream(kModels, {makeRow(d1, "A")}),
                         models),
            "GBM_Pred");
}

// -----------------------------------------------------------------------------
// 5. The error message locates the offending row.
// -----------------------------------------------------------------------------
TEST(SignalStreamTest, ErrorCarriesContext) {
  pairs::SignalStream s(kModels,
                        {makeRow(make_date(2024, 3, 1), "KO_PEP", {-0.1, 0.5})});
  try {
    s.validate({});
    FAIL() << "expected SignalValidationError";
  } catch (const pairs::SignalValidationError& e) {
    EXPECT_EQ(e.date(), "2024-03-01");
    EXPECT_EQ(e.pairId(), "KO_PEP");
    EXPECT_EQ(e.field(), "Ridge_Pred");
    const std::string what = e.what();
    EXPECT_NE(what.find("[pair=KO_PEP]"), std::string::npos);
    EXPECT_NE(what.find("[date=2024-03-01]"), std::string::npos);
  }
}
