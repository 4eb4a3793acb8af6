#pragma once
#include <cstddef>

#include "util/clock.hpp"
#include "util/constants.hpp"

namespace engine
{

using parcellink::Millis;

struct Config
{
    // pacing
    Millis      inter_parcel_delay{constants::INTER_PARCEL_DELAY_MS};
    Millis      intra_chunk_delay{constants::INTRA_CHUNK_DELAY_MS};
    std::size_t link_chunk_size{constants::LINK_CHUNK_SIZE};
    unsigned    parcels_before_pause{constants::PARCELS_BEFORE_PAUSE};
    Millis      listen_window{constants::LISTEN_WINDOW_MS};

    // sender timers and retries
    Millis   receipt_timeout{constants::RECEIPT_TIMEOUT_MS};
    Millis   retention{constants::RETENTION_MS};
    unsigned max_write_retries{constants::MAX_WRITE_RETRIES};
    Millis   write_backoff{constants::WRITE_BACKOFF_MS};
    unsigned max_receipt_rounds{constants::MAX_RECEIPT_ROUNDS};

    // receiver timers
    Millis missing_request_delay{constants::MISSING_REQUEST_DELAY_MS};
    Millis incomplete_timeout{constants::INCOMPLETE_TIMEOUT_MS};
    Millis housekeeping_interval{constants::HOUSEKEEPING_INTERVAL_MS};

    // compression
    bool        compression_enabled{true};
    std::size_t compression_threshold{constants::COMPRESSION_THRESHOLD};

    // worker loop
    Millis poll_interval{5};
    bool   send_hello{true};
};

// Zero pacing, used by tests and the loopback daemon mode.
Config unpaced();

// Applies PARCELLINK_* overrides on top of base; invalid values are logged and ignored.
Config config_from_env(Config base = Config{});

}  // namespace engine
