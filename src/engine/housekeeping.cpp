#include "engine/housekeeping.hpp"
#include "util/log.hpp"

namespace engine
{

SweepReport Housekeeping::sweep(SteadyTime now, TransmitQueue &txq, ReceiveBuffer &rxb)
{
    SweepReport rep;

    rep.unconfirmed = txq.expire_retained(now);
    for (const auto &id : rep.unconfirmed)
        LOG_WARN("Delivery of %s could not be confirmed, dropped from retention", id.c_str());

    rep.discarded = rxb.drop_stale(now, cfg_.incomplete_timeout);
    for (const auto &d : rep.discarded)
    {
        LOG_INFO("Removing stale incomplete message %s (received %zu/%zu parcels)",
                 d.msg_id.c_str(), d.received, d.total);
    }

    for (auto &req : rxb.collect_missing_requests(now, cfg_.missing_request_delay))
    {
        LOG_INFO("Requesting %zu missing parcels for %s", req.parcels.size(), req.msg_id.c_str());
        rep.missing_requests.push_back(receipt::missing(req.msg_id, std::move(req.parcels)));
    }
    return rep;
}

std::optional<SweepReport> Housekeeping::run_if_due(SteadyTime     now,
                                                    TransmitQueue &txq,
                                                    ReceiveBuffer &rxb)
{
    if (!due(now))
        return std::nullopt;
    next_at_ = now + cfg_.housekeeping_interval;
    return sweep(now, txq, rxb);
}

}  // namespace engine
