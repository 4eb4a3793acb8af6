#include <algorithm>
#include <iterator>
#include <sodium.h>

#include "engine/transmit_queue.hpp"
#include "util/log.hpp"

namespace engine
{

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

const char *out_state_name(OutState s)
{
    switch (s)
    {
        case OutState::Queued:
            return "queued";
        case OutState::Sending:
            return "sending";
        case OutState::AwaitingReceipt:
            return "awaiting-receipt";
        case OutState::Retained:
            return "retained";
    }
    return "?";
}

static std::deque<std::uint16_t> all_numbers(std::size_t n)
{
    std::deque<std::uint16_t> out;
    for (std::size_t i = 1; i <= n; ++i)
        out.push_back(static_cast<std::uint16_t>(i));
    return out;
}

TransmitQueue::TransmitQueue(transport::ITransport      &tx,
                             const codec::Negotiator &neg,
                             const Config               &cfg)
    : tx_(tx), neg_(neg), cfg_(cfg)
{
}

std::optional<MessageId> TransmitQueue::allocate_id_locked() const
{
    if (records_.size() >= constants::MSG_ID_SPACE)
        return std::nullopt;
    if (!ensure_sodium_init())
        LOG_WARN("sodium_init failed, message ids may repeat");
    // random start, probe forward to the next identifier not in use
    const std::uint32_t start =
        randombytes_uniform(static_cast<std::uint32_t>(constants::MSG_ID_SPACE));
    for (std::size_t k = 0; k < constants::MSG_ID_SPACE; ++k)
    {
        const std::size_t v = (start + k) % constants::MSG_ID_SPACE;
        MessageId         id{static_cast<char>('A' + v / 26), static_cast<char>('A' + v % 26)};
        if (!records_.count(id))
            return id;
    }
    return std::nullopt;
}

std::optional<MessageId> TransmitQueue::enqueue(const Bytes &payload,
                                                bool         peer_supports_compression,
                                                SteadyTime   now)
{
    // compression runs outside the lock
    codec::Outbound out =
        neg_.prepare_outbound(payload, peer_supports_compression && cfg_.compression_enabled);

    std::lock_guard<std::mutex> lk(mu_);
    auto                        id = allocate_id_locked();
    if (!id)
    {
        LOG_ERROR("enqueue: all %zu message ids in use", constants::MSG_ID_SPACE);
        return std::nullopt;
    }
    auto parcels = parcel::split(*id, out.wire, out.flags);
    if (parcels.empty())
    {
        LOG_ERROR("enqueue: cannot split %zu byte payload", out.wire.size());
        return std::nullopt;
    }

    Outbound rec;
    rec.id         = *id;
    rec.flags      = out.flags;
    rec.created_at = now;
    rec.frames.reserve(parcels.size());
    for (const auto &p : parcels)
    {
        rec.frames.push_back(parcel::encode(p));
        if (rec.frames.back().empty())
        {
            LOG_ERROR("enqueue: encode failed for parcel %u", static_cast<unsigned>(p.number));
            return std::nullopt;
        }
    }
    LOG_INFO("Enqueued %s (%zu bytes, %zu on wire, %zu parcels, flags=0x%02x)", id->c_str(),
             payload.size(), out.wire.size(), rec.frames.size(), static_cast<unsigned>(out.flags));

    records_.emplace(*id, std::move(rec));
    pending_.push_back(*id);
    stats_.enqueued++;
    return id;
}

Millis TransmitQueue::pacing_after(std::size_t frame_size) const
{
    Millis d = cfg_.inter_parcel_delay;
    if (cfg_.link_chunk_size > 0 && frame_size > cfg_.link_chunk_size)
    {
        const std::size_t chunks = (frame_size + cfg_.link_chunk_size - 1) / cfg_.link_chunk_size;
        d += cfg_.intra_chunk_delay * static_cast<Millis::rep>(chunks - 1);
    }
    if (cfg_.parcels_before_pause > 0 && burst_ % cfg_.parcels_before_pause == 0)
        d += cfg_.listen_window;
    return d;
}

bool TransmitQueue::retention_elapsed(const Outbound &rec, SteadyTime now) const
{
    const SteadyTime anchor = rec.last_sent_at.value_or(rec.created_at);
    return now - anchor > cfg_.retention;
}

void TransmitQueue::finish_active_locked(bool failed, const char *why)
{
    if (!active_)
        return;
    auto it = records_.find(*active_);
    if (it != records_.end())
    {
        Outbound &rec = it->second;
        rec.failed    = rec.failed || failed;
        rec.state     = OutState::Retained;
        if (failed)
            LOG_WARN("%s: %s, retained for late receipts", rec.id.c_str(), why);
        else
            LOG_DEBUG("%s: %s", rec.id.c_str(), why);
    }
    active_.reset();
    to_send_.clear();
    burst_          = 0;
    write_failures_ = 0;
    gen_++;
}

void TransmitQueue::link_lost_locked()
{
    resends_.clear();
    if (!active_)
        return;
    auto it = records_.find(*active_);
    if (it != records_.end())
    {
        it->second.state = OutState::Queued;
        pending_.push_front(*active_);
        LOG_WARN("%s: link lost mid-send, requeued at head", active_->c_str());
    }
    active_.reset();
    to_send_.clear();
    burst_          = 0;
    write_failures_ = 0;
    gen_++;
}

void TransmitQueue::run_timers_locked(SteadyTime now)
{
    if (!active_)
        return;
    auto it = records_.find(*active_);
    if (it == records_.end())
    {
        active_.reset();
        return;
    }
    if (it->second.state == OutState::AwaitingReceipt && now >= receipt_deadline_)
    {
        stats_.receipt_timeouts++;
        finish_active_locked(true, "receipt timeout");
    }
}

std::optional<TransmitQueue::Write> TransmitQueue::next_write_locked(SteadyTime now)
{
    if (!link_up_ || now < next_send_at_)
        return std::nullopt;

    if (active_)
    {
        Outbound &rec = records_.at(*active_);
        if (rec.state == OutState::Sending)
        {
            if (!to_send_.empty())
            {
                const std::uint16_t n = to_send_.front();
                return Write{rec.id, n, rec.frames[n - 1], gen_, false, rec.retry_count > 0};
            }
            rec.state         = OutState::AwaitingReceipt;
            receipt_deadline_ = now + cfg_.receipt_timeout;
        }
    }

    // late requests against retained messages, served while nothing is being pushed
    while (!resends_.empty())
    {
        Resend &job = resends_.front();
        auto    it  = records_.find(job.id);
        if (it == records_.end() || job.numbers.empty())
        {
            resends_.pop_front();
            continue;
        }
        const std::uint16_t n = job.numbers.front();
        return Write{job.id, n, it->second.frames[n - 1], gen_, true, false};
    }

    if (!active_ && !pending_.empty())
    {
        const MessageId id = pending_.front();
        pending_.pop_front();
        auto it = records_.find(id);
        if (it == records_.end())
            return std::nullopt;
        Outbound &rec   = it->second;
        rec.state       = OutState::Sending;
        active_         = id;
        to_send_        = all_numbers(rec.frames.size());
        burst_          = 0;
        write_failures_ = 0;
        gen_++;
        LOG_INFO("Sending %s in %zu parcels", id.c_str(), rec.frames.size());
        return Write{id, 1, rec.frames[0], gen_, false, false};
    }
    return std::nullopt;
}

void TransmitQueue::on_write_done_locked(const Write &w, bool ok, SteadyTime now)
{
    auto it = records_.find(w.id);
    if (ok)
    {
        stats_.parcels_sent++;
        burst_++;
        write_failures_ = 0;
        next_send_at_   = now + pacing_after(w.frame.size());
        if (w.resend || w.repeat)
            stats_.parcels_resent++;
        if (it == records_.end())
            return;  // completed or expired while the write was out
        Outbound &rec    = it->second;
        rec.last_sent_at = now;

        if (cfg_.parcels_before_pause > 0 && burst_ % cfg_.parcels_before_pause == 0)
            LOG_DEBUG("listen window after %u parcels", burst_);

        if (w.resend)
        {
            auto job = std::find_if(resends_.begin(), resends_.end(),
                                    [&](const Resend &r) { return r.id == w.id; });
            if (job != resends_.end())
            {
                auto n = std::find(job->numbers.begin(), job->numbers.end(), w.number);
                if (n != job->numbers.end())
                    job->numbers.erase(n);
                if (job->numbers.empty())
                    resends_.erase(job);
            }
            return;
        }
        if (w.gen != gen_ || active_ != w.id)
            return;  // plan replaced while the write was out
        auto n = std::find(to_send_.begin(), to_send_.end(), w.number);
        if (n != to_send_.end())
            to_send_.erase(n);
        if (to_send_.empty())
        {
            rec.state         = OutState::AwaitingReceipt;
            receipt_deadline_ = now + cfg_.receipt_timeout;
            LOG_DEBUG("%s: all parcels out, waiting %lld ms for receipt", rec.id.c_str(),
                      static_cast<long long>(cfg_.receipt_timeout.count()));
        }
        return;
    }

    stats_.write_failures++;
    write_failures_++;
    if (write_failures_ > cfg_.max_write_retries)
    {
        write_failures_ = 0;
        next_send_at_   = now;
        if (w.resend)
        {
            LOG_WARN("%s: giving up retransmitting parcel %u", w.id.c_str(),
                     static_cast<unsigned>(w.number));
            resends_.erase(std::remove_if(resends_.begin(), resends_.end(),
                                          [&](const Resend &r) { return r.id == w.id; }),
                           resends_.end());
        }
        else if (w.gen == gen_ && active_ == w.id)
        {
            if (it != records_.end() && !it->second.last_sent_at)
                it->second.last_sent_at = now;  // retention runs from the abandoned attempt
            finish_active_locked(true, "parcel write failed repeatedly");
        }
        return;
    }
    const Millis backoff = cfg_.write_backoff * (1 << (write_failures_ - 1));
    next_send_at_        = now + backoff;
    LOG_DEBUG("%s: write of parcel %u failed, retry %u in %lld ms", w.id.c_str(),
              static_cast<unsigned>(w.number), write_failures_,
              static_cast<long long>(backoff.count()));
}

void TransmitQueue::tick(SteadyTime now)
{
    // bounded so a zero-pacing config cannot spin here forever
    for (unsigned guard = 0; guard < 4096; ++guard)
    {
        std::optional<Write> w;
        {
            std::lock_guard<std::mutex> lk(mu_);
            run_timers_locked(now);
            w = next_write_locked(now);
        }
        if (!w)
            return;

        const bool ok = tx_.send(w->frame);
        const bool up = ok || tx_.link_ready();

        std::lock_guard<std::mutex> lk(mu_);
        if (!up)
        {
            link_lost_locked();
            next_send_at_ = now + cfg_.write_backoff;
            return;
        }
        on_write_done_locked(*w, ok, now);
    }
}

void TransmitQueue::retransmit_locked(Outbound &rec, std::vector<std::uint16_t> nums)
{
    const bool full = nums.size() == rec.frames.size();
    if (rec.state == OutState::Sending && !full)
    {
        // still pushing: fold the request into the current pass
        for (auto n : nums)
        {
            if (std::find(to_send_.begin(), to_send_.end(), n) == to_send_.end())
                to_send_.push_back(n);
        }
        return;
    }
    rec.retry_count++;
    if (rec.retry_count > cfg_.max_receipt_rounds)
    {
        finish_active_locked(true, "too many retransmission rounds");
        queue_resend_locked(rec.id, nums);
        return;
    }
    LOG_INFO("%s: retransmitting %zu of %zu parcels (round %u)", rec.id.c_str(), nums.size(),
             rec.frames.size(), rec.retry_count);
    to_send_.assign(nums.begin(), nums.end());
    rec.state = OutState::Sending;
    burst_    = 0;
    gen_++;
}

void TransmitQueue::queue_resend_locked(const MessageId &id, const std::vector<std::uint16_t> &nums)
{
    auto job = std::find_if(resends_.begin(), resends_.end(),
                            [&](const Resend &x) { return x.id == id; });
    if (job == resends_.end())
    {
        resends_.push_back(Resend{id, {}});
        job = std::prev(resends_.end());
    }
    for (auto n : nums)
    {
        if (std::find(job->numbers.begin(), job->numbers.end(), n) == job->numbers.end())
            job->numbers.push_back(n);
    }
}

ReceiptOutcome TransmitQueue::on_receipt(const receipt::Receipt &r, SteadyTime now)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = records_.find(r.msg_id);
    if (it != records_.end() && it->second.state == OutState::Retained &&
        retention_elapsed(it->second, now))
    {
        LOG_WARN("%s: %s receipt after retention ran out, delivery unconfirmed",
                 r.msg_id.c_str(), receipt::status_name(r.status));
        resends_.erase(std::remove_if(resends_.begin(), resends_.end(),
                                      [&](const Resend &x) { return x.id == r.msg_id; }),
                       resends_.end());
        records_.erase(it);
        stats_.unconfirmed++;
        return ReceiptOutcome::Unconfirmed;
    }
    if (it == records_.end())
    {
        if (r.status == receipt::Status::Complete)
        {
            LOG_DEBUG("complete receipt for unknown %s", r.msg_id.c_str());
            return ReceiptOutcome::Ignored;
        }
        LOG_INFO("%s receipt for %s: message no longer retained, dropping request",
                 receipt::status_name(r.status), r.msg_id.c_str());
        return ReceiptOutcome::RetentionExpired;
    }

    Outbound  &rec       = it->second;
    const bool is_active = active_ && *active_ == r.msg_id;

    switch (r.status)
    {
        case receipt::Status::Complete:
        {
            LOG_INFO("%s confirmed complete (%s, %u retries)", rec.id.c_str(),
                     out_state_name(rec.state), rec.retry_count);
            if (is_active)
            {
                active_.reset();
                to_send_.clear();
                burst_          = 0;
                write_failures_ = 0;
                gen_++;
            }
            pending_.erase(std::remove(pending_.begin(), pending_.end(), r.msg_id),
                           pending_.end());
            resends_.erase(std::remove_if(resends_.begin(), resends_.end(),
                                          [&](const Resend &x) { return x.id == r.msg_id; }),
                           resends_.end());
            records_.erase(it);
            stats_.delivered++;
            return ReceiptOutcome::Delivered;
        }
        case receipt::Status::Missing:
        case receipt::Status::ChecksumFailed:
        {
            std::vector<std::uint16_t> nums;
            if (r.status == receipt::Status::ChecksumFailed)
            {
                auto all = all_numbers(rec.frames.size());
                nums.assign(all.begin(), all.end());
            }
            else
            {
                for (auto n : r.parcels)
                {
                    if (n >= 1 && n <= rec.frames.size() &&
                        std::find(nums.begin(), nums.end(), n) == nums.end())
                        nums.push_back(n);
                }
            }
            if (nums.empty())
            {
                LOG_WARN("%s: missing receipt names no valid parcels", rec.id.c_str());
                return ReceiptOutcome::Ignored;
            }

            if (is_active)
            {
                retransmit_locked(rec, std::move(nums));
                return ReceiptOutcome::Retransmitting;
            }
            if (rec.state == OutState::Retained)
            {
                queue_resend_locked(r.msg_id, nums);
                LOG_INFO("%s: late %s receipt, resending %zu parcels from retention",
                         rec.id.c_str(), receipt::status_name(r.status), nums.size());
                return ReceiptOutcome::Retransmitting;
            }
            // queued: the full sequence goes out anyway
            return ReceiptOutcome::Ignored;
        }
    }
    return ReceiptOutcome::Ignored;
}

void TransmitQueue::on_link_up(SteadyTime now)
{
    std::lock_guard<std::mutex> lk(mu_);
    link_up_      = true;
    next_send_at_ = now;
    LOG_DEBUG("link up, %zu queued", pending_.size());
}

void TransmitQueue::on_link_down()
{
    std::lock_guard<std::mutex> lk(mu_);
    link_up_ = false;
    link_lost_locked();
}

std::vector<MessageId> TransmitQueue::expire_retained(SteadyTime now)
{
    std::vector<MessageId>      out;
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = records_.begin(); it != records_.end();)
    {
        if (it->second.state == OutState::Retained && retention_elapsed(it->second, now))
        {
            out.push_back(it->first);
            const MessageId id = it->first;
            resends_.erase(std::remove_if(resends_.begin(), resends_.end(),
                                          [&](const Resend &x) { return x.id == id; }),
                           resends_.end());
            it = records_.erase(it);
            stats_.unconfirmed++;
        }
        else
        {
            ++it;
        }
    }
    return out;
}

std::optional<OutboundInfo> TransmitQueue::info(const MessageId &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = records_.find(id);
    if (it == records_.end())
        return std::nullopt;
    const Outbound &rec = it->second;
    return OutboundInfo{rec.state, rec.frames.size(), rec.flags, rec.retry_count, rec.failed,
                        rec.last_sent_at};
}

std::optional<MessageId> TransmitQueue::active() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return active_;
}

std::size_t TransmitQueue::queued() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

std::size_t TransmitQueue::retained() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<std::size_t>(
        std::count_if(records_.begin(), records_.end(),
                      [](const auto &kv) { return kv.second.state == OutState::Retained; }));
}

bool TransmitQueue::idle() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return !active_ && pending_.empty() && resends_.empty();
}

TxStats TransmitQueue::stats() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return stats_;
}

}  // namespace engine
