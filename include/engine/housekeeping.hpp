#pragma once
#include <optional>
#include <vector>

#include "engine/config.hpp"
#include "engine/receive_buffer.hpp"
#include "engine/transmit_queue.hpp"
#include "proto/receipt.hpp"

namespace engine
{

// What one sweep decided; the link engine turns it into receipts and callbacks.
struct SweepReport
{
    std::vector<MessageId>        unconfirmed;       // retention ran out without "complete"
    std::vector<DroppedInbound>   discarded;         // inbound gave up after the timeout
    std::vector<receipt::Receipt> missing_requests;  // to send to the peer
};

// Periodic sweep over both directions of one link. Every check is idempotent and does
// nothing on empty state.
class Housekeeping
{
  public:
    explicit Housekeeping(const Config &cfg) : cfg_(cfg) {}

    bool        due(SteadyTime now) const { return !next_at_ || now >= *next_at_; }
    SweepReport sweep(SteadyTime now, TransmitQueue &txq, ReceiveBuffer &rxb);
    // Runs the sweep when due and schedules the next one.
    std::optional<SweepReport> run_if_due(SteadyTime now, TransmitQueue &txq, ReceiveBuffer &rxb);

    // First sweep one interval after start instead of immediately.
    void arm(SteadyTime now) { next_at_ = now + cfg_.housekeeping_interval; }

  private:
    const Config             &cfg_;
    std::optional<SteadyTime> next_at_;
};

}  // namespace engine
