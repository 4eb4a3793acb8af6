#pragma once
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "codec/negotiator.hpp"
#include "engine/config.hpp"
#include "proto/parcel.hpp"
#include "proto/receipt.hpp"
#include "transport/itransport.hpp"
#include "util/clock.hpp"

namespace engine
{

using parcel::Bytes;
using parcel::MessageId;
using parcellink::SteadyTime;

enum class OutState
{
    Queued,
    Sending,
    AwaitingReceipt,
    Retained
};

const char *out_state_name(OutState s);

enum class ReceiptOutcome
{
    Delivered,
    Retransmitting,
    RetentionExpired,  // nothing left to resend, dropped quietly
    Unconfirmed,       // retention ran out just now; the message is gone
    Ignored
};

struct OutboundInfo
{
    OutState                  state{OutState::Queued};
    std::size_t               parcels{0};
    std::uint8_t              flags{0};
    unsigned                  retry_count{0};
    bool                      failed{false};
    std::optional<SteadyTime> last_sent_at;
};

struct TxStats
{
    std::uint64_t enqueued{0};
    std::uint64_t delivered{0};
    std::uint64_t unconfirmed{0};
    std::uint64_t parcels_sent{0};
    std::uint64_t parcels_resent{0};
    std::uint64_t write_failures{0};
    std::uint64_t receipt_timeouts{0};
};

// Serializes outbound messages over one link: one message in flight, paced parcel writes,
// receipt wait, receipt-driven retransmission and retention of sent parcels.
class TransmitQueue
{
  public:
    TransmitQueue(transport::ITransport &tx, const codec::Negotiator &neg, const Config &cfg);

    // Builds the parcel sequence once. nullopt when the payload is too large or all
    // identifiers are taken.
    std::optional<MessageId> enqueue(const Bytes &payload, bool peer_supports_compression,
                                     SteadyTime now);

    // Runs due timers and performs every write whose pacing deadline has passed.
    // Writes happen without the queue lock held.
    void tick(SteadyTime now);

    ReceiptOutcome on_receipt(const receipt::Receipt &r, SteadyTime now);

    void on_link_up(SteadyTime now);
    void on_link_down();

    // Housekeeping: drops retained messages whose window elapsed since the last parcel
    // was sent. Returned ids were never confirmed.
    std::vector<MessageId> expire_retained(SteadyTime now);

    std::optional<OutboundInfo> info(const MessageId &id) const;
    std::optional<MessageId>    active() const;
    std::size_t                 queued() const;
    std::size_t                 retained() const;
    bool                        idle() const;
    TxStats                     stats() const;

  private:
    struct Outbound
    {
        MessageId                 id;
        std::vector<Bytes>        frames;  // frames[i] is parcel i + 1
        std::uint8_t              flags{0};
        SteadyTime                created_at{};
        std::optional<SteadyTime> last_sent_at;
        unsigned                  retry_count{0};
        bool                      failed{false};
        OutState                  state{OutState::Queued};
    };

    struct Resend
    {
        MessageId                 id;
        std::deque<std::uint16_t> numbers;
    };

    struct Write
    {
        MessageId     id;
        std::uint16_t number{0};
        Bytes         frame;
        std::uint64_t gen{0};
        bool          resend{false};  // served from retention
        bool          repeat{false};  // part of a retransmission round
    };

    std::optional<MessageId> allocate_id_locked() const;
    void                     run_timers_locked(SteadyTime now);
    std::optional<Write>     next_write_locked(SteadyTime now);
    void                     on_write_done_locked(const Write &w, bool ok, SteadyTime now);
    void                     finish_active_locked(bool failed, const char *why);
    void                     link_lost_locked();
    void                     retransmit_locked(Outbound &rec, std::vector<std::uint16_t> nums);
    void queue_resend_locked(const MessageId &id, const std::vector<std::uint16_t> &nums);
    Millis                   pacing_after(std::size_t frame_size) const;
    bool                     retention_elapsed(const Outbound &rec, SteadyTime now) const;

    transport::ITransport       &tx_;
    const codec::Negotiator     &neg_;
    const Config                &cfg_;

    mutable std::mutex            mu_;
    std::map<MessageId, Outbound> records_;  // queued, in flight and retained
    std::deque<MessageId>         pending_;
    std::deque<Resend>            resends_;  // requests against retained messages

    std::optional<MessageId>  active_;
    std::deque<std::uint16_t> to_send_;
    SteadyTime                next_send_at_{};
    SteadyTime                receipt_deadline_{};
    unsigned                  burst_{0};
    unsigned                  write_failures_{0};
    std::uint64_t             gen_{0};
    bool                      link_up_{false};
    TxStats                   stats_;
};

}  // namespace engine
