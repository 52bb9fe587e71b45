#ifndef CONDUIT_CORE_CONFIG_H
#define CONDUIT_CORE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace conduit::core::config {

inline constexpr std::chrono::milliseconds kDefaultTimeout{30000};
inline constexpr bool kDefaultKeepAlive = true;
inline constexpr unsigned kDefaultMaxRedirects = 10;
inline constexpr std::size_t kDefaultMaxContentLength = 5000000;
inline constexpr std::size_t kDefaultMaxHeadersLength = 32 * 1024;
inline constexpr std::size_t kDefaultBufferSize = 16 * 1024;
inline constexpr unsigned kDefaultVerbosity = 0;

inline constexpr std::size_t kPoolMaxPerKey = 6;
inline constexpr std::size_t kPoolMaxTotal = 30;
inline constexpr std::chrono::seconds kPoolIdleTimeout{60};

inline constexpr std::size_t kDiagnosticHistory = 256;

inline constexpr std::uint16_t kFtpDefaultPort = 21;

inline constexpr const char kDefaultUserAgent[] = "conduit/0.1";

}  // namespace conduit::core::config

#endif  // CONDUIT_CORE_CONFIG_H
