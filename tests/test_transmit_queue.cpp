#include <chrono>
#include <cstdint>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <vector>

#include "codec/negotiator.hpp"
#include "engine/transmit_queue.hpp"
#include "proto/receipt.hpp"
#include "transport/loopback_transport.hpp"

using namespace engine;
using namespace std::chrono_literals;

namespace
{

Bytes gen_bytes(std::size_t n)
{
    Bytes v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>(i & 0xFF);
    return v;
}

const SteadyTime T0{};

}  // namespace

// Unpaired loopback: every write lands in `sent`.
class TransmitQueueTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        cfg = unpaced();
        ASSERT_TRUE(tx.start(transport::Settings{},
                             [this](const transport::Frame &f) { sent.push_back(f); }));
    }

    TransmitQueue &queue()
    {
        q = std::make_unique<TransmitQueue>(tx, neg, cfg);
        q->on_link_up(T0);
        return *q;
    }

    transport::LoopbackTransport   tx;
    Config                         cfg;
    codec::Negotiator           neg = codec::make_default_negotiator();
    std::unique_ptr<TransmitQueue> q;
    std::vector<transport::Frame>  sent;
};

TEST_F(TransmitQueueTest, SendsAllParcelsThenWaits)
{
    auto &tq = queue();
    auto  id = tq.enqueue(gen_bytes(1200), false, T0);
    ASSERT_TRUE(id.has_value());
    ASSERT_EQ(tq.info(*id)->state, OutState::Queued);

    tq.tick(T0);
    ASSERT_EQ(sent.size(), 5u);
    EXPECT_EQ(sent[0][0], (*id)[0]);
    EXPECT_EQ(sent[0][1], (*id)[1]);
    auto info = tq.info(*id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->state, OutState::AwaitingReceipt);
    EXPECT_EQ(info->parcels, 5u);
    EXPECT_EQ(info->last_sent_at, T0);
    EXPECT_EQ(tq.stats().parcels_sent, 5u);
}

TEST_F(TransmitQueueTest, CompleteReceiptDelivers)
{
    auto &tq = queue();
    auto  id = tq.enqueue(Bytes{'h', 'i'}, false, T0);
    tq.tick(T0);
    ASSERT_EQ(sent.size(), 1u);

    EXPECT_EQ(tq.on_receipt(receipt::complete(*id), T0 + 1s), ReceiptOutcome::Delivered);
    EXPECT_FALSE(tq.info(*id).has_value());
    EXPECT_TRUE(tq.idle());
    EXPECT_EQ(tq.stats().delivered, 1u);
}

TEST_F(TransmitQueueTest, OneMessageInFlightAtATime)
{
    auto &tq = queue();
    auto  a  = tq.enqueue(gen_bytes(100), false, T0);
    auto  b  = tq.enqueue(gen_bytes(100), false, T0);
    ASSERT_NE(*a, *b);

    tq.tick(T0);
    EXPECT_EQ(sent.size(), 1u);
    EXPECT_EQ(tq.active(), a);
    EXPECT_EQ(tq.queued(), 1u);

    tq.on_receipt(receipt::complete(*a), T0);
    tq.tick(T0);
    EXPECT_EQ(sent.size(), 2u);
    EXPECT_EQ(tq.active(), b);
}

TEST_F(TransmitQueueTest, MissingReceiptResendsOnlyThoseParcels)
{
    auto &tq = queue();
    auto  id = tq.enqueue(gen_bytes(1200), false, T0);
    tq.tick(T0);
    auto first = sent;
    ASSERT_EQ(first.size(), 5u);

    EXPECT_EQ(tq.on_receipt(receipt::missing(*id, {2, 4}), T0 + 1s),
              ReceiptOutcome::Retransmitting);
    tq.tick(T0 + 1s);
    ASSERT_EQ(sent.size(), 7u);
    EXPECT_EQ(sent[5], first[1]);
    EXPECT_EQ(sent[6], first[3]);

    auto info = tq.info(*id);
    EXPECT_EQ(info->state, OutState::AwaitingReceipt);
    EXPECT_EQ(info->retry_count, 1u);
    EXPECT_EQ(tq.stats().parcels_resent, 2u);
}

TEST_F(TransmitQueueTest, ChecksumFailedResendsEverything)
{
    auto &tq = queue();
    auto  id = tq.enqueue(gen_bytes(700), false, T0);
    tq.tick(T0);
    auto first = sent;
    ASSERT_EQ(first.size(), 3u);

    tq.on_receipt(receipt::checksum_failed(*id), T0);
    tq.tick(T0);
    ASSERT_EQ(sent.size(), 6u);
    EXPECT_EQ(std::vector<transport::Frame>(sent.begin() + 3, sent.end()), first);
}

TEST_F(TransmitQueueTest, MissingReceiptIgnoresInvalidNumbers)
{
    auto &tq = queue();
    auto  id = tq.enqueue(gen_bytes(700), false, T0);
    tq.tick(T0);
    EXPECT_EQ(tq.on_receipt(receipt::missing(*id, {9, 10}), T0), ReceiptOutcome::Ignored);
    tq.tick(T0);
    EXPECT_EQ(sent.size(), 3u);
}

TEST_F(TransmitQueueTest, ReceiptTimeoutRetainsThenLateRequestIsServed)
{
    auto &tq = queue();
    auto  id = tq.enqueue(gen_bytes(1200), false, T0);
    tq.tick(T0);
    auto first = sent;

    tq.tick(T0 + 9999ms);
    EXPECT_EQ(tq.info(*id)->state, OutState::AwaitingReceipt);
    tq.tick(T0 + 10s);
    auto info = tq.info(*id);
    EXPECT_EQ(info->state, OutState::Retained);
    EXPECT_TRUE(info->failed);
    EXPECT_EQ(tq.retained(), 1u);
    EXPECT_EQ(tq.stats().receipt_timeouts, 1u);

    EXPECT_EQ(tq.on_receipt(receipt::missing(*id, {3}), T0 + 20s),
              ReceiptOutcome::Retransmitting);
    tq.tick(T0 + 20s);
    ASSERT_EQ(sent.size(), 6u);
    EXPECT_EQ(sent[5], first[2]);
    EXPECT_EQ(tq.info(*id)->last_sent_at, T0 + 20s);

    EXPECT_EQ(tq.on_receipt(receipt::complete(*id), T0 + 21s), ReceiptOutcome::Delivered);
    EXPECT_EQ(tq.retained(), 0u);
}

TEST_F(TransmitQueueTest, RetentionMeasuredFromLastSend)
{
    auto &tq = queue();
    auto  id = tq.enqueue(gen_bytes(300), false, T0);
    tq.tick(T0);
    tq.tick(T0 + 10s);  // receipt timeout
    ASSERT_EQ(tq.info(*id)->state, OutState::Retained);

    EXPECT_TRUE(tq.expire_retained(T0 + 120s).empty());
    auto gone = tq.expire_retained(T0 + 121s);
    ASSERT_EQ(gone.size(), 1u);
    EXPECT_EQ(gone[0], *id);
    EXPECT_FALSE(tq.info(*id).has_value());
    EXPECT_EQ(tq.stats().unconfirmed, 1u);
}

TEST_F(TransmitQueueTest, LateRequestAfterRetentionReportsUnconfirmed)
{
    auto &tq = queue();
    auto  id = tq.enqueue(gen_bytes(300), false, T0);
    tq.tick(T0);
    tq.tick(T0 + 10s);

    // no sweep ran; the receipt itself notices the window is over
    EXPECT_EQ(tq.on_receipt(receipt::missing(*id, {2}), T0 + 121s),
              ReceiptOutcome::Unconfirmed);
    EXPECT_FALSE(tq.info(*id).has_value());
    EXPECT_EQ(tq.stats().unconfirmed, 1u);
    tq.tick(T0 + 121s);
    EXPECT_EQ(sent.size(), 2u);

    // already reported; neither a repeat nor the sweep counts it again
    EXPECT_EQ(tq.on_receipt(receipt::missing(*id, {2}), T0 + 122s),
              ReceiptOutcome::RetentionExpired);
    EXPECT_TRUE(tq.expire_retained(T0 + 300s).empty());
    EXPECT_EQ(tq.stats().unconfirmed, 1u);
}

TEST_F(TransmitQueueTest, ReceiptsForUnknownIds)
{
    auto &tq = queue();
    EXPECT_EQ(tq.on_receipt(receipt::missing("QQ", {2}), T0), ReceiptOutcome::RetentionExpired);
    EXPECT_EQ(tq.on_receipt(receipt::checksum_failed("QQ"), T0),
              ReceiptOutcome::RetentionExpired);
    EXPECT_EQ(tq.on_receipt(receipt::complete("QQ"), T0), ReceiptOutcome::Ignored);
}

TEST_F(TransmitQueueTest, ReceiptForQueuedMessageIgnored)
{
    auto &tq = queue();
    auto  a  = tq.enqueue(gen_bytes(10), false, T0);
    auto  b  = tq.enqueue(gen_bytes(10), false, T0);
    tq.tick(T0);
    ASSERT_EQ(tq.active(), a);
    EXPECT_EQ(tq.on_receipt(receipt::missing(*b, {1}), T0), ReceiptOutcome::Ignored);
    EXPECT_EQ(tq.info(*b)->state, OutState::Queued);
}

TEST_F(TransmitQueueTest, RetransmissionRoundsAreCapped)
{
    auto &tq = queue();
    auto  id = tq.enqueue(gen_bytes(700), false, T0);
    tq.tick(T0);
    for (unsigned round = 1; round <= 3; ++round)
    {
        tq.on_receipt(receipt::missing(*id, {2}), T0);
        tq.tick(T0);
        EXPECT_EQ(tq.info(*id)->retry_count, round);
        EXPECT_EQ(tq.info(*id)->state, OutState::AwaitingReceipt);
    }
    const auto before = sent.size();
    EXPECT_EQ(tq.on_receipt(receipt::missing(*id, {2}), T0), ReceiptOutcome::Retransmitting);
    auto info = tq.info(*id);
    EXPECT_EQ(info->state, OutState::Retained);
    EXPECT_TRUE(info->failed);
    EXPECT_FALSE(tq.active().has_value());

    // the request that hit the cap is still served, from retention
    tq.tick(T0);
    ASSERT_EQ(sent.size(), before + 1);
    EXPECT_EQ(sent.back(), sent[1]);
    EXPECT_EQ(tq.info(*id)->retry_count, 4u);
    EXPECT_EQ(tq.info(*id)->state, OutState::Retained);
}

TEST_F(TransmitQueueTest, RequestDuringSendFoldsIntoCurrentPass)
{
    cfg.inter_parcel_delay = 100ms;
    cfg.intra_chunk_delay  = 0ms;
    cfg.listen_window      = 0ms;
    auto &tq               = queue();
    auto  id               = tq.enqueue(gen_bytes(700), false, T0);

    tq.tick(T0);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(tq.on_receipt(receipt::missing(*id, {1}), T0 + 10ms),
              ReceiptOutcome::Retransmitting);
    tq.tick(T0 + 100ms);
    tq.tick(T0 + 200ms);
    tq.tick(T0 + 300ms);
    ASSERT_EQ(sent.size(), 4u);
    EXPECT_EQ(sent[3], sent[0]);
    EXPECT_EQ(tq.info(*id)->retry_count, 0u);
}

TEST_F(TransmitQueueTest, WriteFailuresRetriedWithBackoff)
{
    cfg.write_backoff = 100ms;
    auto &tq          = queue();
    auto  id          = tq.enqueue(gen_bytes(10), false, T0);
    tx.fail_next_writes(2);

    tq.tick(T0);
    EXPECT_TRUE(sent.empty());
    tq.tick(T0 + 99ms);
    EXPECT_TRUE(sent.empty());
    tq.tick(T0 + 100ms);  // second failure, next try 200 ms later
    EXPECT_TRUE(sent.empty());
    tq.tick(T0 + 299ms);
    EXPECT_TRUE(sent.empty());
    tq.tick(T0 + 300ms);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(tq.info(*id)->state, OutState::AwaitingReceipt);
    EXPECT_FALSE(tq.info(*id)->failed);
    EXPECT_EQ(tq.stats().write_failures, 2u);
}

TEST_F(TransmitQueueTest, PersistentWriteFailureRetainsAndMovesOn)
{
    auto &tq = queue();
    auto  a  = tq.enqueue(gen_bytes(10), false, T0);
    auto  b  = tq.enqueue(gen_bytes(10), false, T0);
    tx.fail_next_writes(4);

    tq.tick(T0);
    auto info = tq.info(*a);
    EXPECT_EQ(info->state, OutState::Retained);
    EXPECT_TRUE(info->failed);
    EXPECT_EQ(tq.info(*b)->state, OutState::AwaitingReceipt);
    EXPECT_EQ(sent.size(), 1u);
}

TEST_F(TransmitQueueTest, LinkLossRequeuesAtHeadWithoutRetry)
{
    auto &tq = queue();
    auto  a  = tq.enqueue(gen_bytes(700), false, T0);
    auto  b  = tq.enqueue(gen_bytes(10), false, T0);

    // the link drops right after the second parcel went out
    tx.stop();
    sent.clear();
    ASSERT_TRUE(tx.start(transport::Settings{}, [this](const transport::Frame &f) {
        sent.push_back(f);
        if (sent.size() == 2)
            tx.set_link_ready(false);
    }));

    tq.tick(T0);
    EXPECT_EQ(sent.size(), 2u);
    EXPECT_EQ(tq.info(*a)->state, OutState::Queued);
    EXPECT_EQ(tq.info(*a)->retry_count, 0u);
    EXPECT_FALSE(tq.active().has_value());
    EXPECT_EQ(tq.queued(), 2u);

    tq.on_link_down();
    tx.set_link_ready(true);
    tq.on_link_up(T0 + 1s);
    tq.tick(T0 + 1s);
    // whole sequence again, then the first message waits for its receipt
    EXPECT_EQ(sent.size(), 5u);
    EXPECT_EQ(sent[2], sent[0]);
    EXPECT_EQ(tq.active(), a);
    EXPECT_EQ(tq.info(*b)->state, OutState::Queued);
}

TEST_F(TransmitQueueTest, NothingSentWhileLinkDown)
{
    auto &tq = queue();
    tq.on_link_down();
    tq.enqueue(gen_bytes(10), false, T0);
    tq.tick(T0);
    EXPECT_TRUE(sent.empty());
    tq.on_link_up(T0);
    tq.tick(T0);
    EXPECT_EQ(sent.size(), 1u);
}

TEST_F(TransmitQueueTest, InterParcelPacing)
{
    cfg = Config{};
    auto &tq = queue();
    tq.enqueue(gen_bytes(700), false, T0);

    tq.tick(T0);
    ASSERT_EQ(sent.size(), 1u);
    ASSERT_EQ(sent[0].size(), 280u);
    // 500 ms between parcels plus 30 ms for each extra 20-byte chunk
    tq.tick(T0 + 889ms);
    EXPECT_EQ(sent.size(), 1u);
    tq.tick(T0 + 890ms);
    EXPECT_EQ(sent.size(), 2u);
}

TEST_F(TransmitQueueTest, ListenWindowEveryFiveParcels)
{
    cfg.listen_window = 200ms;
    auto &tq          = queue();
    tq.enqueue(gen_bytes(1900), false, T0);  // 7 parcels

    tq.tick(T0);
    EXPECT_EQ(sent.size(), 5u);
    tq.tick(T0 + 199ms);
    EXPECT_EQ(sent.size(), 5u);
    tq.tick(T0 + 200ms);
    EXPECT_EQ(sent.size(), 7u);
}

TEST_F(TransmitQueueTest, CompressedWhenPeerSupportsIt)
{
    auto &tq = queue();
    Bytes text;
    for (int i = 0; i < 200; ++i)
    {
        const char *s = "hello parcel link ";
        text.insert(text.end(), s, s + 18);
    }
    auto packed = tq.enqueue(text, true, T0);
    auto raw    = tq.enqueue(text, false, T0);
    EXPECT_EQ(tq.info(*packed)->flags, codec::ALGO_DEFLATE);
    EXPECT_LT(tq.info(*packed)->parcels, tq.info(*raw)->parcels);
    EXPECT_EQ(tq.info(*raw)->flags, codec::ALGO_NONE);

    cfg.compression_enabled = false;
    auto off                = tq.enqueue(text, true, T0);
    EXPECT_EQ(tq.info(*off)->flags, codec::ALGO_NONE);
}

TEST_F(TransmitQueueTest, IdentifiersUniqueUntilExhausted)
{
    auto &tq = queue();
    tq.on_link_down();
    std::set<MessageId> ids;
    for (int i = 0; i < 676; ++i)
    {
        auto id = tq.enqueue(Bytes{}, false, T0);
        ASSERT_TRUE(id.has_value());
        EXPECT_TRUE(parcel::valid_msg_id(*id));
        ids.insert(*id);
    }
    EXPECT_EQ(ids.size(), 676u);
    EXPECT_FALSE(tq.enqueue(Bytes{}, false, T0).has_value());
}

TEST_F(TransmitQueueTest, OversizedPayloadRejected)
{
    auto &tq = queue();
    EXPECT_FALSE(tq.enqueue(Bytes(271 + 65534u * 276u + 1), false, T0).has_value());
    EXPECT_EQ(tq.queued(), 0u);
}
