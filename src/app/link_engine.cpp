#include <chrono>
#include <string>
#include <utility>

#include "app/link_engine.hpp"
#include "proto/ctrl.hpp"
#include "util/log.hpp"

namespace app
{

LinkEngine::LinkEngine(transport::ITransport &t, engine::Config cfg, const parcellink::IClock &clock)
    : tx_(t),
      cfg_(std::move(cfg)),
      clock_(clock),
      neg_(codec::make_default_negotiator(cfg_.compression_threshold)),
      txq_(t, neg_, cfg_),
      hk_(cfg_)
{
}

LinkEngine::~LinkEngine()
{
    worker_stop_.store(true);
    if (worker_.joinable())
        worker_.join();
}

bool LinkEngine::start(const transport::Settings &s, bool spawn_worker)
{
    // in case a previous worker is still around
    stop();

    bool ok = tx_.start(s, [this](const transport::Frame &f) { this->on_bytes_received(f); });
    if (!ok)
        return false;
    started_ = true;
    hk_.arm(clock_.now());
    LOG_DEBUG("link engine started on %s transport", tx_.name().c_str());

    if (!spawn_worker)
        return true;

    worker_stop_.store(false);
    worker_ = std::thread([this] {
        while (!worker_stop_.load())
        {
            poll();
            std::this_thread::sleep_for(cfg_.poll_interval);
        }
    });
    return true;
}

void LinkEngine::stop()
{
    worker_stop_.store(true);
    if (worker_.joinable())
        worker_.join();
    if (started_.exchange(false))
    {
        txq_.on_link_down();
        last_ready_ = false;
        tx_.stop();
    }
}

std::optional<MessageId> LinkEngine::enqueue_message(const Bytes &payload,
                                                     bool         peer_supports_compression)
{
    return txq_.enqueue(payload, peer_supports_compression, clock_.now());
}

std::optional<MessageId> LinkEngine::enqueue_message(const Bytes &payload)
{
    return enqueue_message(payload, peer_compress_.load());
}

void LinkEngine::poll()
{
    if (!started_)
        return;
    const auto now   = clock_.now();
    const bool ready = tx_.link_ready();

    // link edges
    if (ready && !last_ready_)
    {
        LOG_INFO("link up");
        txq_.on_link_up(now);
        if (cfg_.send_hello)
            send_hello();
    }
    else if (!ready && last_ready_)
    {
        LOG_WARN("link down, pausing transmit queue");
        txq_.on_link_down();
    }
    last_ready_ = ready;

    txq_.tick(now);

    if (auto rep = hk_.run_if_due(now, txq_, rxb_))
    {
        rx_discarded_ += rep->discarded.size();
        for (auto &r : rep->missing_requests)
            send_receipt(std::move(r));
        for (const auto &id : rep->unconfirmed)
        {
            if (on_unconfirmed_)
                on_unconfirmed_(id);
        }
    }
}

void LinkEngine::on_bytes_received(const transport::Frame &f)
{
    if (ctrl::is_hello(f))
    {
        handle_hello(f);
        return;
    }
    if (receipt::looks_like_receipt(f))
    {
        auto r = receipt::parse(f);
        if (!r)
        {
            rx_malformed_++;
            LOG_WARN("dropping unparsable receipt (%zu bytes)", f.size());
            return;
        }
        on_receipt_received(*r);
        return;
    }
    handle_parcel(f);
}

void LinkEngine::on_receipt_received(const receipt::Receipt &r)
{
    LOG_DEBUG("receipt for %s: %s", r.msg_id.c_str(), receipt::status_name(r.status));
    switch (txq_.on_receipt(r, clock_.now()))
    {
        case engine::ReceiptOutcome::Delivered:
            if (on_delivered_)
                on_delivered_(r.msg_id);
            break;
        case engine::ReceiptOutcome::Unconfirmed:
            if (on_unconfirmed_)
                on_unconfirmed_(r.msg_id);
            break;
        default:
            break;
    }
}

void LinkEngine::handle_hello(const transport::Frame &f)
{
    ctrl::Hello h{};
    if (!ctrl::parse_hello(f.data(), f.size(), h))
    {
        rx_malformed_++;
        LOG_WARN("[CTRL] malformed HELLO dropped");
        return;
    }
    bool compress = false;
    for (const auto &algo : ctrl::compression_algorithms(h))
    {
        if (neg_.supports_name(algo))
            compress = true;
    }
    peer_compress_.store(compress);
    LOG_INFO("[CTRL] HELLO in: user='%s' caps=%zu compression=%s",
             h.user_id.empty() ? "<none>" : h.user_id.c_str(), h.caps.size(),
             compress ? "yes" : "no");
}

void LinkEngine::send_hello()
{
    std::vector<std::string> caps;
    if (cfg_.compression_enabled)
        caps = neg_.capability_tokens();
    auto bytes = ctrl::encode_hello(user_id_, caps);
    if (tx_.send(bytes))
        LOG_INFO("[CTRL] HELLO out: user='%s' caps=%zu", user_id_.c_str(), caps.size());
    else
        LOG_WARN("[CTRL] HELLO send failed");
}

void LinkEngine::send_receipt(receipt::Receipt r)
{
    // a receipt has to fit one link write; the rest is asked for on the next sweep
    if (r.status == receipt::Status::Missing)
    {
        while (r.parcels.size() > 1 &&
               receipt::encode(r).size() > constants::MAX_PARCEL_SIZE)
            r.parcels.pop_back();
    }
    if (!tx_.send(receipt::encode_bytes(r)))
    {
        LOG_WARN("failed to send %s receipt for %s", receipt::status_name(r.status),
                 r.msg_id.c_str());
        return;
    }
    LOG_DEBUG("sent %s receipt for %s", receipt::status_name(r.status), r.msg_id.c_str());
}

void LinkEngine::handle_parcel(const transport::Frame &f)
{
    MessageId id;
    auto      res = rxb_.add_frame(f, clock_.now(), &id);
    if (res == engine::AddResult::Rejected)
    {
        rx_malformed_++;
        return;
    }
    if (res != engine::AddResult::Completed)
        return;

    auto a = rxb_.assemble(id);
    switch (a.status)
    {
        case engine::AssembleStatus::Ok:
        {
            Bytes plain;
            auto  st = neg_.restore_inbound(a.flags, a.payload, plain);
            if (st != codec::DecodeStatus::Ok)
            {
                rx_undecodable_++;
                LOG_ERROR("%s: %s, discarding message", id.c_str(),
                          st == codec::DecodeStatus::UnsupportedCompression
                              ? "unsupported compression"
                              : "decompression failed");
                return;
            }
            rx_messages_++;
            LOG_INFO("Message %s complete, checksum verified (%zu bytes)", id.c_str(),
                     plain.size());
            send_receipt(receipt::complete(id));
            if (on_message_)
                on_message_(id, plain);
            return;
        }
        case engine::AssembleStatus::ChecksumMismatch:
            rx_checksum_failures_++;
            send_receipt(receipt::checksum_failed(id));
            return;
        case engine::AssembleStatus::MissingParcels:
        case engine::AssembleStatus::UnknownMessage:
            // raced with housekeeping
            LOG_DEBUG("%s: nothing to assemble", id.c_str());
            return;
    }
}

LinkStats LinkEngine::stats() const
{
    LinkStats s;
    s.tx                = txq_.stats();
    s.messages_received = rx_messages_.load();
    s.checksum_failures = rx_checksum_failures_.load();
    s.malformed_frames  = rx_malformed_.load();
    s.undecodable       = rx_undecodable_.load();
    s.inbound_discarded = rx_discarded_.load();
    s.inbound_pending   = rxb_.pending();
    s.outbound_queued   = txq_.queued();
    s.outbound_retained = txq_.retained();
    return s;
}

}  // namespace app
