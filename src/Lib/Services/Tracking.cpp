#include <CCStatus/Services/Tracking.hpp>

#include <cctype> // std::isdigit
#include <chrono> // std::chrono::{year_month_day, sys_days, hours, minutes, seconds, nanoseconds}
#include <format> // std::format

#include <CCStatus/Utils/Error.hpp>
#include <CCStatus/Utils/File.hpp>
#include <CCStatus/Utils/Logging.hpp>
#include <CCStatus/Utils/Strings.hpp>

namespace ccstatus::services::tracking {
  namespace {
    using namespace ccstatus::utils::types;

    using ccstatus::core::metrics::TimePoint;
    using ccstatus::core::session::LatencySample;
    using ccstatus::utils::error::StatusError;
    using ccstatus::utils::file::ReadTextFile;
    using ccstatus::utils::strings::ParseNumber;
    using ccstatus::utils::strings::Trim;

    using enum ccstatus::utils::error::StatusErrorCode;

    namespace keys = ccstatus::core::provider::keys;

    auto AllDigits(const StringView str) -> bool {
      if (str.empty())
        return false;

      for (const CStr chr : str)
        if (!std::isdigit(static_cast<u8>(chr)))
          return false;

      return true;
    }

    /// Fixed-width unsigned field at @p pos.
    auto Field(const StringView text, const usize pos, const usize width) -> Result<i32> {
      const StringView field = text.substr(pos, width);

      if (field.size() != width || !AllDigits(field))
        ERR_FMT(ParseError, "Expected {} digits at offset {} in '{}'", width, pos, text);

      return ParseNumber<i32>(field);
    }

    auto ExpectChar(const StringView text, const usize pos, const StringView accepted) -> Result<> {
      if (pos >= text.size() || !accepted.contains(text[pos]))
        ERR_FMT(ParseError, "Expected one of '{}' at offset {} in '{}'", accepted, pos, text);

      return {};
    }
  } // namespace

  auto ParseRfc3339(const StringView text) -> Result<TimePoint> {
    using std::chrono::day;
    using std::chrono::hours;
    using std::chrono::minutes;
    using std::chrono::month;
    using std::chrono::nanoseconds;
    using std::chrono::seconds;
    using std::chrono::sys_days;
    using std::chrono::year;
    using std::chrono::year_month_day;

    const StringView value = Trim(text);

    // YYYY-MM-DDTHH:MM:SS
    TRY_VOID(ExpectChar(value, 4, "-"));
    TRY_VOID(ExpectChar(value, 7, "-"));
    TRY_VOID(ExpectChar(value, 10, "Tt"));
    TRY_VOID(ExpectChar(value, 13, ":"));
    TRY_VOID(ExpectChar(value, 16, ":"));

    const i32 yearValue   = TRY(Field(value, 0, 4));
    const i32 monthValue  = TRY(Field(value, 5, 2));
    const i32 dayValue    = TRY(Field(value, 8, 2));
    const i32 hourValue   = TRY(Field(value, 11, 2));
    const i32 minuteValue = TRY(Field(value, 14, 2));
    const i32 secondValue = TRY(Field(value, 17, 2));

    const year_month_day date { year { yearValue }, month { static_cast<u32>(monthValue) }, day { static_cast<u32>(dayValue) } };

    if (!date.ok() || hourValue > 23 || minuteValue > 59 || secondValue > 59)
      ERR_FMT(ParseError, "Timestamp out of range: '{}'", value);

    usize       pos = 19;
    nanoseconds fraction { 0 };

    if (pos < value.size() && value[pos] == '.') {
      const usize start = ++pos;

      while (pos < value.size() && std::isdigit(static_cast<u8>(value[pos])))
        ++pos;

      if (pos == start)
        ERR_FMT(ParseError, "Empty fractional seconds in '{}'", value);

      i64 scale = 100'000'000;

      for (usize i = start; i < pos && scale > 0; ++i, scale /= 10)
        fraction += nanoseconds { (value[i] - '0') * scale };
    }

    TRY_VOID(ExpectChar(value, pos, "Zz+-"));

    seconds offset { 0 };

    if (value[pos] == '+' || value[pos] == '-') {
      TRY_VOID(ExpectChar(value, pos + 3, ":"));

      const i32 offsetHours   = TRY(Field(value, pos + 1, 2));
      const i32 offsetMinutes = TRY(Field(value, pos + 4, 2));

      if (offsetHours > 23 || offsetMinutes > 59)
        ERR_FMT(ParseError, "Time zone offset out of range: '{}'", value);

      offset = hours { offsetHours } + minutes { offsetMinutes };

      if (value[pos] == '-')
        offset = -offset;

      pos += 6;
    } else {
      pos += 1;
    }

    if (pos != value.size())
      ERR_FMT(ParseError, "Trailing characters after timestamp: '{}'", value);

    const auto local = sys_days { date } + hours { hourValue } + minutes { minuteValue } + seconds { secondValue } + fraction;

    return std::chrono::time_point_cast<TimePoint::duration>(local - offset);
  }

  auto ParseLatency(const StringView text) -> Result<LatencySample> {
    Vec<StringView> lines;

    StringView rest = Trim(text);

    while (!rest.empty()) {
      const usize      newline = rest.find('\n');
      const StringView line    = rest.substr(0, newline);

      lines.push_back(Trim(line));

      if (newline == StringView::npos)
        break;

      rest = rest.substr(newline + 1);
    }

    if (lines.size() < 3)
      ERR_FMT(ParseError, "Latency file has {} line(s), expected 3", lines.size());

    return LatencySample {
      .averageMs    = ParseNumber<f64>(lines[0]).value_or(0.0),
      .lastMs       = ParseNumber<f64>(lines[1]).value_or(0.0),
      .requestCount = ParseNumber<i64>(lines[2]).value_or(0),
    };
  }

  TrackingProvider::TrackingProvider()
    : FieldMapProvider("tracking") {}

  auto TrackingProvider::load(const fs::path& directory) -> Result<> {
    std::error_code errc;

    if (!fs::is_directory(directory, errc)) {
      StatusError err(NotFound, std::format("Tracking directory not found: {}", directory.string()));
      setLastError(err);
      return Err(std::move(err));
    }

    if (Result<String> content = ReadTextFile(directory / LATENCY_FILE)) {
      if (Result<LatencySample> sample = ParseLatency(*content)) {
        setNumber(keys::LatencyAvgMs, sample->averageMs);
        setNumber(keys::LatencyLastMs, sample->lastMs);
        setInteger(keys::RequestCount, sample->requestCount);
      } else {
        debug_log("Ignoring {}: {}", LATENCY_FILE, sample.error().message);
      }
    }

    if (Result<String> content = ReadTextFile(directory / SESSION_START_FILE)) {
      if (Result<TimePoint> start = ParseRfc3339(*content))
        setText(keys::WindowStart, String(Trim(*content)));
      else
        debug_log("Ignoring {}: {}", SESSION_START_FILE, start.error().message);
    }

    if (Result<String> content = ReadTextFile(directory / SESSION_ID_FILE))
      if (const StringView sessionId = Trim(*content); !sessionId.empty())
        setText(keys::SessionId, String(sessionId));

    return {};
  }

  auto TrackingProvider::latency() const -> Option<LatencySample> {
    const Option<f64> average = getNumber(keys::LatencyAvgMs);

    if (!average)
      return None;

    return LatencySample {
      .averageMs    = *average,
      .lastMs       = getNumber(keys::LatencyLastMs).value_or(0.0),
      .requestCount = getInteger(keys::RequestCount).value_or(0),
    };
  }
} // namespace ccstatus::services::tracking
