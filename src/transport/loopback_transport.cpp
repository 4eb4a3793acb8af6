#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a fake link to exercise the parcel engine without a radio.
bool LoopbackTransport::start(const Settings &s, OnFrame on_rx)
{
    on_rx_     = std::move(on_rx);
    max_frame_ = s.max_frame;
    started_   = true;
    return true;
}

void LoopbackTransport::pair(LoopbackTransport &a, LoopbackTransport &b)
{
    a.peer_ = &b;
    b.peer_ = &a;
}

void LoopbackTransport::set_drop_filter(DropFilter f)
{
    std::lock_guard<std::mutex> lk(filter_mu_);
    drop_ = std::move(f);
}

bool LoopbackTransport::send(const Frame &one_parcel)
{
    if (!started_ || !link_up_)
        return false;
    if (max_frame_ != 0 && one_parcel.size() > max_frame_)
    {
        LOG_WARN("loopback: frame of %zu bytes exceeds %zu", one_parcel.size(), max_frame_);
        return false;
    }
    unsigned pending_failures = fail_writes_.load();
    while (pending_failures > 0 &&
           !fail_writes_.compare_exchange_weak(pending_failures, pending_failures - 1))
    {
    }
    if (pending_failures > 0)
        return false;

    sent_++;
    {
        std::lock_guard<std::mutex> lk(filter_mu_);
        if (drop_ && drop_(one_parcel))
        {
            dropped_++;
            return true;  // the radio accepted it, the air lost it
        }
    }
    LoopbackTransport *dst = peer_ ? peer_ : this;
    dst->deliver(one_parcel);
    return true;
}

void LoopbackTransport::deliver(const Frame &f)
{
    if (started_ && on_rx_)
        on_rx_(f);
}

void LoopbackTransport::stop()
{
    started_ = false;
}

bool LoopbackTransport::link_ready() const
{
    return started_ && link_up_;
}

}  // namespace transport
