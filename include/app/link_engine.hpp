#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include "codec/negotiator.hpp"
#include "engine/config.hpp"
#include "engine/housekeeping.hpp"
#include "engine/receive_buffer.hpp"
#include "engine/transmit_queue.hpp"
#include "proto/receipt.hpp"
#include "transport/itransport.hpp"
#include "util/clock.hpp"

namespace app
{

using parcel::Bytes;
using parcel::MessageId;

struct LinkStats
{
    engine::TxStats tx;
    std::uint64_t   messages_received{0};
    std::uint64_t   checksum_failures{0};
    std::uint64_t   malformed_frames{0};
    std::uint64_t   undecodable{0};  // unsupported or corrupt compression
    std::uint64_t   inbound_discarded{0};
    std::size_t     inbound_pending{0};
    std::size_t     outbound_queued{0};
    std::size_t     outbound_retained{0};
};

// Owns the whole protocol state for one link. Transport callbacks, the worker thread
// (or a test calling poll()) and the public API may run concurrently.
class LinkEngine
{
  public:
    using OnMessage = std::function<void(const MessageId &, const Bytes &)>;
    using OnId      = std::function<void(const MessageId &)>;

    LinkEngine(transport::ITransport &t, engine::Config cfg, const parcellink::IClock &clock);
    ~LinkEngine();

    LinkEngine(const LinkEngine &)            = delete;
    LinkEngine &operator=(const LinkEngine &) = delete;

    // Callbacks must be set before start().
    void set_on_message_ready(OnMessage cb) { on_message_ = std::move(cb); }
    void set_on_delivered(OnId cb) { on_delivered_ = std::move(cb); }
    void set_on_unconfirmed(OnId cb) { on_unconfirmed_ = std::move(cb); }
    void set_user_id(std::string u) { user_id_ = std::move(u); }

    // spawn_worker=false leaves scheduling to explicit poll() calls.
    bool start(const transport::Settings &s = transport::Settings{}, bool spawn_worker = true);
    void stop();

    std::optional<MessageId> enqueue_message(const Bytes &payload, bool peer_supports_compression);
    // Uses the capability learnt from the peer's HELLO.
    std::optional<MessageId> enqueue_message(const Bytes &payload);

    void on_bytes_received(const transport::Frame &f);
    void on_receipt_received(const receipt::Receipt &r);

    // One scheduling step: link edges, pacing and receipt timers, housekeeping.
    void poll();

    bool      peer_supports_compression() const { return peer_compress_.load(); }
    LinkStats stats() const;

    engine::TransmitQueue &tx_queue() { return txq_; }
    engine::ReceiveBuffer &rx_buffer() { return rxb_; }

  private:
    void handle_parcel(const transport::Frame &f);
    void handle_hello(const transport::Frame &f);
    void send_receipt(receipt::Receipt r);
    void send_hello();

    transport::ITransport    &tx_;
    engine::Config            cfg_;
    const parcellink::IClock &clock_;
    codec::Negotiator      neg_;
    engine::TransmitQueue     txq_;
    engine::ReceiveBuffer     rxb_;
    engine::Housekeeping      hk_;

    OnMessage   on_message_;
    OnId        on_delivered_;
    OnId        on_unconfirmed_;
    std::string user_id_;

    std::atomic<bool> peer_compress_{false};
    bool              last_ready_{false};
    std::atomic<bool> started_{false};

    std::thread       worker_;
    std::atomic_bool  worker_stop_{true};

    std::atomic<std::uint64_t> rx_messages_{0};
    std::atomic<std::uint64_t> rx_checksum_failures_{0};
    std::atomic<std::uint64_t> rx_malformed_{0};
    std::atomic<std::uint64_t> rx_undecodable_{0};
    std::atomic<std::uint64_t> rx_discarded_{0};
};

}  // namespace app
