#include <cstdlib>
#include <cstring>

#include "engine/config.hpp"
#include "util/log.hpp"

namespace engine
{

Config unpaced()
{
    Config c;
    c.inter_parcel_delay = Millis(0);
    c.intra_chunk_delay  = Millis(0);
    c.listen_window      = Millis(0);
    c.write_backoff      = Millis(0);
    return c;
}

static bool env_millis(const char *key, unsigned long lo, unsigned long hi, Millis &out)
{
    const char *e = std::getenv(key);
    if (!e)
        return false;
    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (!*e || !p || *p != '\0' || v < lo || v > hi)
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", key, e, lo, hi);
        return false;
    }
    out = Millis(static_cast<Millis::rep>(v));
    LOG_INFO("Using %s=%lu ms", key, v);
    return true;
}

Config config_from_env(Config c)
{
    env_millis("PARCELLINK_INTER_PARCEL_MS", 0, 10'000, c.inter_parcel_delay);
    env_millis("PARCELLINK_LISTEN_WINDOW_MS", 0, 10'000, c.listen_window);
    env_millis("PARCELLINK_RECEIPT_TIMEOUT_MS", 100, 600'000, c.receipt_timeout);
    env_millis("PARCELLINK_RETENTION_MS", 1'000, 3'600'000, c.retention);

    if (const char *e = std::getenv("PARCELLINK_COMPRESSION"))
    {
        if (std::strcmp(e, "0") == 0 || std::strcmp(e, "off") == 0)
            c.compression_enabled = false;
        else if (std::strcmp(e, "1") == 0 || std::strcmp(e, "on") == 0)
            c.compression_enabled = true;
        else
            LOG_WARN("Ignoring invalid PARCELLINK_COMPRESSION='%s' (expect on|off)", e);
    }
    return c;
}

}  // namespace engine
