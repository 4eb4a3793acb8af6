#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Parcel layout. 280 is the largest write that constrained peripherals take without
// overflowing their link-layer buffers.
inline constexpr std::size_t MAX_PARCEL_SIZE   = 280;
inline constexpr std::size_t HEADER_OVERHEAD   = 9;  // id(2) total(2) crc(4) flags(1)
inline constexpr std::size_t DATA_OVERHEAD     = 4;  // id(2) num(2)
inline constexpr std::size_t HEADER_CAPACITY   = MAX_PARCEL_SIZE - HEADER_OVERHEAD;  // 271
inline constexpr std::size_t DATA_CAPACITY     = MAX_PARCEL_SIZE - DATA_OVERHEAD;    // 276
inline constexpr std::size_t MSG_ID_LEN        = 2;
inline constexpr std::size_t MSG_ID_SPACE      = 26 * 26;
inline constexpr std::size_t MAX_PARCELS       = UINT16_MAX;

// Compression
inline constexpr std::size_t COMPRESSION_THRESHOLD = 300;
inline constexpr std::size_t MAX_INFLATED_SIZE     = 1024 * 1024;

// Sender pacing (ms)
inline constexpr unsigned INTER_PARCEL_DELAY_MS = 500;
inline constexpr unsigned INTRA_CHUNK_DELAY_MS  = 30;
inline constexpr unsigned LINK_CHUNK_SIZE       = 20;  // default ATT payload per chunk
inline constexpr unsigned PARCELS_BEFORE_PAUSE  = 5;
inline constexpr unsigned LISTEN_WINDOW_MS      = 200;

// Timers (ms)
inline constexpr unsigned RECEIPT_TIMEOUT_MS        = 10'000;
inline constexpr unsigned RETENTION_MS              = 120'000;
inline constexpr unsigned MISSING_REQUEST_DELAY_MS  = 5'000;
inline constexpr unsigned INCOMPLETE_TIMEOUT_MS     = 60'000;
inline constexpr unsigned HOUSEKEEPING_INTERVAL_MS  = 10'000;

// Retries
inline constexpr unsigned MAX_WRITE_RETRIES    = 3;
inline constexpr unsigned WRITE_BACKOFF_MS     = 100;  // doubled per retry
inline constexpr unsigned MAX_RECEIPT_ROUNDS   = 3;

// Capability token advertised in HELLO
inline constexpr std::string_view CAP_COMPRESSION_PREFIX = "compression:";

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("PARCELLINK_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/parcel-link/ctl.sock";
    LOG_SYSTEM("Listening on %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
