#pragma once

#include "core/json_dom.hpp"

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plugeval::reconcile {

// Zone-less calendar time as the platform reports it (`YYYY-MM-DD HH:MM:SS`).
struct CivilTime {
  int year = 1970;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;
  int second = 0;

  auto operator<=>(const CivilTime& other) const = default;
};

// Field names that may carry a record's time, in trial order.
inline constexpr std::array<std::string_view, 4> kTimestampFields = {
    "start_time",
    "created_at",
    "timestamp",
    "end_time",
};

// Nested mapping consulted after the record itself for every field.
inline constexpr std::string_view kMetadataField = "completion_metadata";

// Strict `YYYY-MM-DD HH:MM:SS` parse with calendar range checks.
std::optional<CivilTime> ParseCivilTime(std::string_view text);

std::string FormatCivilTime(const CivilTime& time);

// Applies the normalization steps in order (drop `Z` zone markers, `T` to a
// space, cut a `+offset` suffix, cut fractional seconds, trim) and then parses
// strictly. `2024-01-15T10:30:00.123456+00:00` and `2024-01-15 10:30:00`
// yield the same instant.
std::optional<CivilTime> NormalizeTimestamp(std::string_view raw);

// First timestamp field that parses, trying each field name in order and, per
// field, the record before its metadata mapping. Non-text values are skipped.
std::optional<CivilTime> ReconcileRecordTimestamp(const core::json::Value& record);

// Start of the evaluation window in both representations the platform uses.
struct WindowBoundary {
  std::string text;
  CivilTime civil;
  // Same civil time interpreted in the local zone.
  std::int64_t epoch_seconds = 0;
};

// Resolves the window start: an explicit `YYYY-MM-DD HH:MM:SS` value when
// given, else local `now` minus five minutes.
//
// Returns false with `error` when the explicit value is malformed.
bool ResolveWindowBoundary(const std::optional<std::string>& explicit_start,
                           std::chrono::system_clock::time_point now, WindowBoundary& boundary,
                           std::string& error);

bool IsInWindow(const CivilTime& time, const WindowBoundary& boundary);

// Numeric policy: compares a raw epoch value, no text parsing involved.
bool IsEpochInWindow(double epoch_seconds, const WindowBoundary& boundary);

// Records retained by client-side reconciliation. Pointers refer into the
// array handed to the Reconcile* call and share its lifetime.
struct ReconciledSet {
  std::vector<const core::json::Value*> in_window;
  std::size_t total_returned = 0;

  // An empty unfiltered set reconciles to zero, never "unknown".
  std::size_t Count() const {
    return in_window.size();
  }
};

// Text-timestamp policy over a list payload (nullptr means "no records").
ReconciledSet ReconcileByTimestamp(const core::json::Value* records,
                                   const WindowBoundary& boundary);

// Epoch policy over a list payload using the numeric `field` of each record.
// Records whose field is absent or not numeric are out of window.
ReconciledSet ReconcileByEpoch(const core::json::Value* records, std::string_view field,
                               const WindowBoundary& boundary);

} // namespace plugeval::reconcile
