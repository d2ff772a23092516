#include "reconcile/timestamp_reconciler.hpp"

#include "core/string_utils.hpp"
#include "core/time_utils.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace plugeval::reconcile {

namespace {

using NormalizeStep = std::string (*)(std::string);

std::string DropZoneMarkers(std::string text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c != 'Z') {
      out.push_back(c);
    }
  }
  return out;
}

std::string DateTimeSeparatorToSpace(std::string text) {
  for (char& c : text) {
    if (c == 'T') {
      c = ' ';
    }
  }
  return text;
}

std::string DropPositiveOffset(std::string text) {
  const auto plus = text.find('+');
  if (plus != std::string::npos) {
    text.erase(plus);
  }
  return text;
}

std::string DropFractionalSeconds(std::string text) {
  const auto dot = text.find('.');
  if (dot != std::string::npos) {
    text.erase(dot);
  }
  return text;
}

std::string TrimStep(std::string text) {
  return core::Trim(text);
}

// Order matters: the offset cut must see the string after `T` replacement, and
// the fraction cut must run after the offset cut so `.123+00:00` disappears.
constexpr std::array<NormalizeStep, 5> kNormalizeSteps = {
    &DropZoneMarkers,
    &DateTimeSeparatorToSpace,
    &DropPositiveOffset,
    &DropFractionalSeconds,
    &TrimStep,
};

bool ReadDigits(std::string_view text, std::size_t offset, std::size_t count, int& value) {
  value = 0;
  for (std::size_t i = offset; i < offset + count; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  return true;
}

bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
  static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && IsLeapYear(year)) {
    return 29;
  }
  return kDays[static_cast<std::size_t>(month - 1)];
}

std::optional<std::int64_t> LocalEpochSeconds(const CivilTime& time) {
  std::tm local{};
  local.tm_year = time.year - 1900;
  local.tm_mon = time.month - 1;
  local.tm_mday = time.day;
  local.tm_hour = time.hour;
  local.tm_min = time.minute;
  local.tm_sec = time.second;
  local.tm_isdst = -1;
  const std::time_t epoch = std::mktime(&local);
  if (epoch == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(epoch);
}

std::optional<CivilTime> ParseTextField(const core::json::Value& source, std::string_view field) {
  const std::optional<std::string> text = core::json::GetString(source, field);
  if (!text.has_value() || text->empty()) {
    return std::nullopt;
  }
  return NormalizeTimestamp(*text);
}

} // namespace

std::optional<CivilTime> ParseCivilTime(std::string_view text) {
  // YYYY-MM-DD HH:MM:SS
  if (text.size() != 19U || text[4] != '-' || text[7] != '-' || text[10] != ' ' ||
      text[13] != ':' || text[16] != ':') {
    return std::nullopt;
  }

  CivilTime time;
  if (!ReadDigits(text, 0, 4, time.year) || !ReadDigits(text, 5, 2, time.month) ||
      !ReadDigits(text, 8, 2, time.day) || !ReadDigits(text, 11, 2, time.hour) ||
      !ReadDigits(text, 14, 2, time.minute) || !ReadDigits(text, 17, 2, time.second)) {
    return std::nullopt;
  }

  if (time.year < 1 || time.month < 1 || time.month > 12 || time.day < 1 ||
      time.day > DaysInMonth(time.year, time.month) || time.hour > 23 || time.minute > 59 ||
      time.second > 59) {
    return std::nullopt;
  }
  return time;
}

std::string FormatCivilTime(const CivilTime& time) {
  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << time.year << '-' << std::setw(2) << time.month
      << '-' << std::setw(2) << time.day << ' ' << std::setw(2) << time.hour << ':'
      << std::setw(2) << time.minute << ':' << std::setw(2) << time.second;
  return out.str();
}

std::optional<CivilTime> NormalizeTimestamp(std::string_view raw) {
  std::string text(raw);
  for (const NormalizeStep step : kNormalizeSteps) {
    text = step(std::move(text));
  }
  return ParseCivilTime(text);
}

std::optional<CivilTime> ReconcileRecordTimestamp(const core::json::Value& record) {
  const core::json::Value* metadata = record.Find(kMetadataField);
  for (const std::string_view field : kTimestampFields) {
    if (auto parsed = ParseTextField(record, field); parsed.has_value()) {
      return parsed;
    }
    if (metadata != nullptr && metadata->IsObject()) {
      if (auto parsed = ParseTextField(*metadata, field); parsed.has_value()) {
        return parsed;
      }
    }
  }
  return std::nullopt;
}

bool ResolveWindowBoundary(const std::optional<std::string>& explicit_start,
                           std::chrono::system_clock::time_point now, WindowBoundary& boundary,
                           std::string& error) {
  boundary = WindowBoundary{};
  if (explicit_start.has_value()) {
    boundary.text = core::Trim(*explicit_start);
  } else {
    boundary.text = core::FormatLocalTimestamp(now - std::chrono::minutes(5));
  }

  const std::optional<CivilTime> civil = ParseCivilTime(boundary.text);
  if (!civil.has_value()) {
    error = "invalid evaluation start time '" + boundary.text +
            "' (expected YYYY-MM-DD HH:MM:SS)";
    return false;
  }
  boundary.civil = *civil;

  const std::optional<std::int64_t> epoch = LocalEpochSeconds(*civil);
  if (!epoch.has_value()) {
    error = "evaluation start time '" + boundary.text + "' is not representable as epoch";
    return false;
  }
  boundary.epoch_seconds = *epoch;
  return true;
}

bool IsInWindow(const CivilTime& time, const WindowBoundary& boundary) {
  return time >= boundary.civil;
}

bool IsEpochInWindow(double epoch_seconds, const WindowBoundary& boundary) {
  return std::isfinite(epoch_seconds) &&
         epoch_seconds >= static_cast<double>(boundary.epoch_seconds);
}

ReconciledSet ReconcileByTimestamp(const core::json::Value* records,
                                   const WindowBoundary& boundary) {
  ReconciledSet set;
  if (records == nullptr || !records->IsArray()) {
    return set;
  }
  set.total_returned = records->array_value.size();
  for (const auto& record : records->array_value) {
    const std::optional<CivilTime> time = ReconcileRecordTimestamp(record);
    if (time.has_value() && IsInWindow(*time, boundary)) {
      set.in_window.push_back(&record);
    }
  }
  return set;
}

ReconciledSet ReconcileByEpoch(const core::json::Value* records, std::string_view field,
                               const WindowBoundary& boundary) {
  ReconciledSet set;
  if (records == nullptr || !records->IsArray()) {
    return set;
  }
  set.total_returned = records->array_value.size();
  for (const auto& record : records->array_value) {
    const std::optional<double> epoch = core::json::GetNumber(record, field);
    if (epoch.has_value() && IsEpochInWindow(*epoch, boundary)) {
      set.in_window.push_back(&record);
    }
  }
  return set;
}

} // namespace plugeval::reconcile
