#include "pairs/signal/signal_csv_loader.hpp"
#include "pairs/domain/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace pairs {

namespace {

constexpr const char* kPredSuffix = "_Pred";

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n\"");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = s.find_last_not_of(" \t\r\n\"");
  return s.substr(first, last - first + 1);
}

std::vector<std::string> splitLine(const std::string& line) {
  std::vector<std::string> tokens;
  std::stringstream ss(line);
  std::string token;
  while (std::getline(ss, token, ',')) {
    tokens.push_back(trim(token));
  }
  // getline drops a trailing empty field ("a,b,"); restore it.
  if (!line.empty() && line.back() == ',') {
    tokens.emplace_back();
  }
  return tokens;
}

bool isNanToken(const std::string& s) {
  if (s.empty()) {
    return true;
  }
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower == "nan" || lower == "na" || lower == "null";
}

struct Columns {
  int date{-1};
  int pair{-1};
  int z{-1};
  int spread{-1};
  int target_return{-1};
  int target_direction{-1};
  std::vector<int> preds;
  std::vector<std::string> models;
};

Columns resolveColumns(const std::vector<std::string>& header) {
  Columns c;
  for (std::size_t i = 0; i < header.size(); ++i) {
    const std::string& name = header[i];
    const int idx = static_cast<int>(i);
    if (name == "Date" || (i == 0 && name.empty())) {
      c.date = idx;
    } else if (name == "Pair_ID") {
      c.pair = idx;
    } else if (name == "Z_Score") {
      c.z = idx;
    } else if (name == "Spread") {
      c.spread = idx;
    } else if (name == "Target_Return") {
      c.target_return = idx;
    } else if (name == "Target_Direction") {
      c.target_direction = idx;
    } else if (name.size() > std::char_traits<char>::length(kPredSuffix) &&
               name.compare(name.size() - 5, 5, kPredSuffix) == 0) {
      c.preds.push_back(idx);
      c.models.push_back(name.substr(0, name.size() - 5));
    }
  }

  std::string missing;
  auto check = [&missing](int idx, const char* name) {
    if (idx < 0) {
      missing += missing.empty() ? name : std::string(", ") + name;
    }
  };
  check(c.date, "Date");
  check(c.pair, "Pair_ID");
  check(c.z, "Z_Score");
  check(c.target_return, "Target_Return");
  check(c.target_direction, "Target_Direction");
  if (c.preds.empty()) {
    check(-1, "<Model>_Pred");
  }
  if (!missing.empty()) {
    throw SignalValidationError("", "", missing,
                                "missing required columns: " + missing);
  }
  return c;
}

class RowParser {
 public:
  RowParser(const std::vector<std::string>& header,
            const std::vector<std::string>& tokens, std::size_t line_num)
      : header_(header), tokens_(tokens), line_num_(line_num) {}

  void setContext(std::string date, std::string pair) {
    date_ = std::move(date);
    pair_ = std::move(pair);
  }

  const std::string& text(int col) const { return tokens_[col]; }

  double number(int col, bool nan_allowed) const {
    const std::string& s = tokens_[col];
    if (isNanToken(s)) {
      if (nan_allowed) {
        return std::numeric_limits<double>::quiet_NaN();
      }
      fail(col, "missing value");
    }
    try {
      std::size_t consumed = 0;
      const double v = std::stod(s, &consumed);
      if (consumed != s.size()) {
        fail(col, "trailing characters in number '" + s + "'");
      }
      return v;
    } catch (const std::invalid_argument&) {
      fail(col, "not a number: '" + s + "'");
    } catch (const std::out_of_range&) {
      fail(col, "number out of range: '" + s + "'");
    }
    return 0.0;
  }

  [[noreturn]] void fail(int col, const std::string& detail) const {
    throw SignalValidationError(
        date_, pair_, header_[col],
        "line " + std::to_string(line_num_) + ": " + detail);
  }

 private:
  const std::vector<std::string>& header_;
  const std::vector<std::string>& tokens_;
  std::size_t line_num_;
  std::string date_;
  std::string pair_;
};

}  // namespace

SignalStream loadSignalCsv(std::istream& in) {
  std::string line;
  if (!std::getline(in, line)) {
    throw SignalValidationError("", "", "", "empty signal file");
  }

  const std::vector<std::string> header = splitLine(line);
  const Columns cols = resolveColumns(header);

  std::vector<domain::SignalRow> rows;
  std::size_t line_num = 1;

  while (std::getline(in, line)) {
    ++line_num;
    if (trim(line).empty()) {
      continue;
    }

    const std::vector<std::string> tokens = splitLine(line);
    if (tokens.size() != header.size()) {
      throw SignalValidationError(
          "", "", "",
          "line " + std::to_string(line_num) + ": expected " +
              std::to_string(header.size()) + " fields, found " +
              std::to_string(tokens.size()));
    }

    RowParser p(header, tokens, line_num);

    domain::SignalRow row;
    const auto date = parse_date(p.text(cols.date));
    if (!date) {
      p.fail(cols.date, "invalid date '" + p.text(cols.date) + "'");
    }
    row.date = *date;
    row.pair_id = p.text(cols.pair);
    p.setContext(p.text(cols.date), row.pair_id);

    row.z_score = p.number(cols.z, true);
    if (cols.spread >= 0) {
      row.spread_price = p.number(cols.spread, true);
    }
    row.target_return = p.number(cols.target_return, true);

    const double dir = p.number(cols.target_direction, false);
    if (dir != 0.0 && dir != 1.0) {
      p.fail(cols.target_direction, "target direction must be 0 or 1");
    }
    row.target_direction = static_cast<int>(dir);

    row.predictions.reserve(cols.preds.size());
    for (int col : cols.preds) {
      row.predictions.push_back(p.number(col, false));
    }

    rows.push_back(std::move(row));
  }

  return SignalStream(cols.models, std::move(rows));
}

SignalStream loadSignalCsvFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw SignalValidationError("", "", "",
                                "cannot open signal file: " + path);
  }
  return loadSignalCsv(in);
}

}  // namespace pairs
