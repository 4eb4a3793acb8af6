#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

#include "app/link_engine.hpp"
#include "ctl/ipc.hpp"
#include "engine/config.hpp"
#include "transport/loopback_transport.hpp"
#include "util/clock.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

static app::LinkEngine *g_engine = nullptr;

// ---------------- helpers ----------------
static std::string trim(const std::string &s)
{
    auto l = s.find_first_not_of(" \t\r");
    if (l == std::string::npos)
        return std::string{};
    auto r = s.find_last_not_of(" \t\r");
    return s.substr(l, r - l + 1);
}

static bool read_file(const std::string &path, parcel::Bytes &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

static std::string enqueue_reply(const parcel::Bytes &payload)
{
    auto id = g_engine->enqueue_message(payload);
    if (!id)
        return "ERR enqueue failed";
    LOG_INFO("Queued %s (%zu bytes)", id->c_str(), payload.size());
    return "OK " + *id;
}

static std::string status_line()
{
    auto        s = g_engine->stats();
    char        buf[320];
    std::snprintf(buf, sizeof(buf),
                  "OK queued=%zu retained=%zu sent=%llu delivered=%llu unconfirmed=%llu "
                  "parcels=%llu resent=%llu received=%llu checksum_failures=%llu "
                  "malformed=%llu pending_in=%zu",
                  s.outbound_queued, s.outbound_retained, (unsigned long long)s.tx.enqueued,
                  (unsigned long long)s.tx.delivered, (unsigned long long)s.tx.unconfirmed,
                  (unsigned long long)s.tx.parcels_sent, (unsigned long long)s.tx.parcels_resent,
                  (unsigned long long)s.messages_received,
                  (unsigned long long)s.checksum_failures, (unsigned long long)s.malformed_frames,
                  s.inbound_pending);
    return buf;
}

static std::string on_line(const std::string &line)
{
    LOG_DEBUG("IPC line: %s", line.c_str());
    if (!g_engine)
        return "ERR not ready";
    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "OK";
    }
    if (line == "STATUS")
        return status_line();
    if (line.rfind("SEND ", 0) == 0)
    {
        auto msg = trim(line.substr(5));
        if (msg.empty())
        {
            LOG_WARN("CMD: SEND ignored (empty payload)");
            return "ERR empty payload";
        }
        LOG_INFO("CMD: SEND %s", msg.c_str());
        return enqueue_reply(parcel::Bytes(msg.begin(), msg.end()));
    }
    if (line.rfind("SENDFILE ", 0) == 0)
    {
        auto          path = ipc::expand_user(trim(line.substr(9)));
        parcel::Bytes payload;
        if (path.empty() || !read_file(path, payload))
        {
            LOG_WARN("CMD: SENDFILE cannot read '%s'", path.c_str());
            return "ERR cannot read " + path;
        }
        LOG_INFO("CMD: SENDFILE %s", path.c_str());
        return enqueue_reply(payload);
    }
    LOG_WARN("CMD: unknown '%s'", line.c_str());
    return "ERR unknown command";
}

int main()
{
    // log level from env var
    const char *log_level = std::getenv("PARCELLINK_LOG_LEVEL");
    if (log_level)
    {
        parcellink::set_log_level_by_name(log_level);
    }

    auto cfg = engine::config_from_env();
    LOG_SYSTEM("Config: transport=loopback inter_parcel=%lldms receipt_timeout=%lldms "
               "retention=%lldms compression=%s",
               (long long)cfg.inter_parcel_delay.count(), (long long)cfg.receipt_timeout.count(),
               (long long)cfg.retention.count(), cfg.compression_enabled ? "on" : "off");

    // the radio link is external; loopback echoes our own frames back
    auto                    tx = std::make_unique<transport::LoopbackTransport>();
    parcellink::SteadyClock clock;
    app::LinkEngine         link(*tx, cfg, clock);
    if (const char *u = std::getenv("PARCELLINK_USER_ID"))
        link.set_user_id(u);

    link.set_on_message_ready([](const parcel::MessageId &id, const parcel::Bytes &payload) {
        std::string text(payload.begin(), payload.end());
        LOG_SYSTEM("[RECV] %s (%zu bytes): %s", id.c_str(), payload.size(), text.c_str());
    });
    link.set_on_delivered(
        [](const parcel::MessageId &id) { LOG_SYSTEM("[DELIVERED] %s", id.c_str()); });
    link.set_on_unconfirmed(
        [](const parcel::MessageId &id) { LOG_WARN("[UNCONFIRMED] %s", id.c_str()); });

    if (!link.start())
    {
        LOG_ERROR("LinkEngine start failed");
        return 1;
    }
    g_engine = &link;

    // IPC server
    std::string sock = ipc::expand_user(constants::ctl_sock_path());
    bool        ok   = ipc::start_server(sock, &on_line);
    g_engine         = nullptr;
    link.stop();
    if (!ok)
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    return 0;
}
