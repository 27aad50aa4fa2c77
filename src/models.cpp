#include <stylefix/models.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace stylefix {
namespace {

bool StrictlyInside(std::size_t position, const TextSpan &span) {
  return position > span.start && position < span.End();
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

bool TextSpan::OverlapsWith(const TextSpan &other) const {
  if (length == 0 || other.length == 0) {
    // Insertions conflict with anything starting at the same position or
    // with a replacement they would split.
    return start == other.start || StrictlyInside(start, other) ||
           StrictlyInside(other.start, *this);
  }
  return std::max(start, other.start) < std::min(End(), other.End());
}

std::optional<std::string> OptionSet::Get(const std::string &key) const {
  const auto found = values_.find(key);
  if (found == values_.end()) {
    return std::nullopt;
  }
  return found->second;
}

std::string OptionSet::GetOr(const std::string &key,
                             const std::string &fallback) const {
  return Get(key).value_or(fallback);
}

bool OptionSet::GetBool(const std::string &key, bool fallback) const {
  const auto value = Get(key);
  if (!value) {
    return fallback;
  }
  const auto normalized = ToLower(*value);
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Option '" + key +
                              "' is not a boolean: " + *value);
}

int OptionSet::GetInt(const std::string &key, int fallback) const {
  const auto value = Get(key);
  if (!value) {
    return fallback;
  }
  try {
    std::size_t consumed = 0;
    const auto parsed = std::stoi(*value, &consumed);
    if (consumed != value->size()) {
      throw std::invalid_argument(*value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Option '" + key +
                                "' is not an integer: " + *value);
  }
}

OptionSet OptionSet::WithValue(const std::string &key,
                               std::string value) const {
  auto values = values_;
  values[key] = std::move(value);
  return OptionSet(std::move(values));
}

OptionSet OptionSet::MergedWith(const OptionSet &overrides) const {
  auto values = values_;
  for (const auto &[key, value] : overrides.Values()) {
    values[key] = value;
  }
  return OptionSet(std::move(values));
}

} // namespace stylefix
