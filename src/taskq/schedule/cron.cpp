#include "taskq/schedule/cron.hpp"

#include "taskq/util/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <optional>
#include <span>
#include <vector>

namespace taskq {
namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 6>
    kMacros{{
        {"@yearly", "0 0 1 1 *"},
        {"@annually", "0 0 1 1 *"},
        {"@monthly", "0 0 1 * *"},
        {"@weekly", "0 0 * * 0"},
        {"@daily", "0 0 * * *"},
        {"@hourly", "0 * * * *"},
    }};

constexpr std::array<std::string_view, 12> kMonthNames{
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};

constexpr std::array<std::string_view, 7> kWeekdayNames{
    "sun", "mon", "tue", "wed", "thu", "fri", "sat"};

// Five years of days, plus slack for leap days.
constexpr int kSearchDays = 5 * 366 + 2;

struct FieldSpec {
  std::string_view label;
  int lo;
  int hi;
  std::span<const std::string_view> names;
  int first_name_value;
};

// Day-of-week accepts 7 and folds it onto Sunday after parsing.
constexpr std::array<FieldSpec, 5> kFields{{
    {"minute", 0, 59, {}, 0},
    {"hour", 0, 23, {}, 0},
    {"day-of-month", 1, 31, {}, 0},
    {"month", 1, 12, kMonthNames, 1},
    {"day-of-week", 0, 7, kWeekdayNames, 0},
}};

struct ParsedField {
  std::bitset<64> allowed;
  bool wildcard{true};
};

auto lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto split_on(std::string_view s, char delim) -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    auto end = s.find(delim, start);
    parts.push_back(s.substr(start, end - start));
    if (end == std::string_view::npos) {
      return parts;
    }
    start = end + 1;
  }
}

auto fields_of(std::string_view s) -> std::vector<std::string_view> {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
      ++i;
    }
    auto start = i;
    while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) {
      ++i;
    }
    if (i > start) {
      out.push_back(s.substr(start, i - start));
    }
  }
  return out;
}

auto number(std::string_view s) -> std::optional<int> {
  int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return v;
}

auto value_of(std::string_view s, const FieldSpec& spec) -> std::optional<int> {
  if (auto v = number(s)) {
    return v;
  }
  auto name = lower(s);
  for (std::size_t i = 0; i < spec.names.size(); ++i) {
    if (spec.names[i] == name) {
      return spec.first_name_value + static_cast<int>(i);
    }
  }
  return std::nullopt;
}

// One comma-separated term: "*", "?", "v", "a-b", each with optional "/step".
auto apply_term(std::string_view term, const FieldSpec& spec,
                ParsedField& field) -> bool {
  int step = 1;
  bool stepped = false;
  if (auto slash = term.find('/'); slash != std::string_view::npos) {
    auto s = number(term.substr(slash + 1));
    if (!s || *s <= 0) {
      return false;
    }
    step = *s;
    stepped = true;
    term = term.substr(0, slash);
  }

  int lo = spec.lo;
  int hi = spec.hi;
  if (term == "*" || term == "?") {
    if (stepped) {
      field.wildcard = false;
    }
  } else {
    field.wildcard = false;
    auto dash = term.find('-');
    auto first = value_of(term.substr(0, dash), spec);
    if (!first) {
      return false;
    }
    lo = *first;
    if (dash != std::string_view::npos) {
      auto last = value_of(term.substr(dash + 1), spec);
      if (!last) {
        return false;
      }
      hi = *last;
    } else if (!stepped) {
      hi = lo;
    }
  }

  if (lo < spec.lo || hi > spec.hi || lo > hi) {
    return false;
  }
  for (int v = lo; v <= hi; v += step) {
    field.allowed.set(static_cast<std::size_t>(v));
  }
  return true;
}

auto parse_field(std::string_view text, const FieldSpec& spec)
    -> std::optional<ParsedField> {
  ParsedField field;
  for (auto term : split_on(text, ',')) {
    if (term.empty() || !apply_term(term, spec, field)) {
      return std::nullopt;
    }
  }
  return field;
}

}  // namespace

auto CronSchedule::parse(std::string_view spec) -> Result<CronSchedule> {
  auto parts = fields_of(spec);
  if (parts.empty()) {
    return fail(Error::InvalidArgument);
  }

  std::string_view expanded = spec;
  if (parts.size() == 1 && parts[0].starts_with('@')) {
    auto macro = lower(parts[0]);
    auto it = std::ranges::find(kMacros, std::string_view(macro),
                                [](const auto& m) { return m.first; });
    if (it == kMacros.end()) {
      return fail(Error::ParseError);
    }
    expanded = it->second;
    parts = fields_of(expanded);
  }
  if (parts.size() != kFields.size()) {
    return fail(Error::ParseError);
  }

  CronSchedule out;
  std::array<Field*, 5> targets{&out.minute_, &out.hour_, &out.dom_,
                                &out.month_, &out.dow_};
  for (std::size_t i = 0; i < kFields.size(); ++i) {
    auto parsed = parse_field(parts[i], kFields[i]);
    if (!parsed) {
      log::debug("cron '{}': bad {} field '{}'", spec, kFields[i].label,
                 parts[i]);
      return fail(Error::ParseError);
    }
    targets[i]->allowed = parsed->allowed;
    targets[i]->wildcard = parsed->wildcard;
  }
  if (out.dow_.allowed.test(7)) {
    out.dow_.allowed.reset(7);
    out.dow_.allowed.set(0);
  }

  auto first = spec.find_first_not_of(" \t\n\r");
  auto last = spec.find_last_not_of(" \t\n\r");
  out.spec_ = std::string(spec.substr(first, last - first + 1));
  return ok(std::move(out));
}

// With both day fields restricted a day matches either one, as in Vixie
// cron; otherwise the restricted one decides.
auto CronSchedule::day_matches(std::chrono::year_month_day ymd,
                               std::chrono::weekday wd) const -> bool {
  bool by_dom = dom_.has(static_cast<unsigned>(ymd.day()));
  bool by_dow = dow_.has(wd.c_encoding());
  if (dom_.wildcard && dow_.wildcard) {
    return true;
  }
  if (dom_.wildcard) {
    return by_dow;
  }
  if (dow_.wildcard) {
    return by_dom;
  }
  return by_dom || by_dow;
}

auto CronSchedule::next_after(TimePoint after) const -> TimePoint {
  using namespace std::chrono;
  auto start = std::chrono::floor<minutes>(after) + minutes{1};
  auto first_day = std::chrono::floor<days>(start);
  auto start_minute =
      static_cast<int>(duration_cast<minutes>(start - first_day).count());

  auto day = first_day;
  for (int n = 0; n < kSearchDays; ++n, day += days{1}) {
    year_month_day ymd{day};
    if (!month_.has(static_cast<unsigned>(ymd.month())) ||
        !day_matches(ymd, weekday{day})) {
      continue;
    }
    int from = (n == 0) ? start_minute : 0;
    for (int h = from / 60; h < 24; ++h) {
      if (!hour_.has(static_cast<unsigned>(h))) {
        continue;
      }
      int m0 = (h == from / 60) ? from % 60 : 0;
      for (int m = m0; m < 60; ++m) {
        if (minute_.has(static_cast<unsigned>(m))) {
          return TimePoint{day} + hours{h} + minutes{m};
        }
      }
    }
  }
  return TimePoint::max();
}

auto validate_cronspec(std::string_view spec) -> Result<void> {
  if (auto parsed = CronSchedule::parse(spec); !parsed) {
    log::warn("Invalid cron expression '{}': {}", spec,
              parsed.error().message());
    return std::unexpected(parsed.error());
  }
  return ok();
}

}  // namespace taskq
