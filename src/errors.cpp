#include "errors.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace gri {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidFormat:
    return "InvalidFormat";
  case ErrorKind::MissingOwnerOrRepo:
    return "MissingOwnerOrRepo";
  case ErrorKind::InvalidTokenFormat:
    return "InvalidTokenFormat";
  case ErrorKind::AppAuthFailed:
    return "AppAuthFailed";
  case ErrorKind::RepositoryNotFound:
    return "RepositoryNotFound";
  case ErrorKind::RateLimitExceeded:
    return "RateLimitExceeded";
  case ErrorKind::ProviderApiError:
    return "ProviderApiError";
  }
  return "Unknown";
}

/**
 * Render a time point the same way JavaScript's `Date.toISOString()` does,
 * e.g. `2024-01-01T00:00:00.000Z`.
 */
std::string format_iso8601(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
  if (ms < 0) {
    ms += 1000;
  }
  std::time_t t = system_clock::to_time_t(tp);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << ms << 'Z';
  return oss.str();
}

} // namespace gri
