#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>

#include "transport/itransport.hpp"

namespace transport {

// In-process link. Without a peer every write comes straight back to the sender.
// The fault hooks let tests lose frames, fail writes and drop the link.
class LoopbackTransport final : public ITransport {
public:
  using DropFilter = std::function<bool(const Frame&)>;

  bool start(const Settings& s, OnFrame on_rx) override;
  bool send(const Frame& one_parcel) override;
  void stop() override;
  std::string name() const override { return "loopback"; }
  bool link_ready() const override;

  // Wires a and b to each other.
  static void pair(LoopbackTransport& a, LoopbackTransport& b);

  void set_drop_filter(DropFilter f);        // true => frame silently lost
  void fail_next_writes(unsigned n) { fail_writes_.store(n); }
  void set_link_ready(bool up) { link_up_.store(up); }

  std::size_t frames_sent() const { return sent_.load(); }
  std::size_t frames_dropped() const { return dropped_.load(); }

private:
  void deliver(const Frame& f);

  OnFrame                on_rx_{};
  std::size_t            max_frame_{0};
  std::atomic<bool>      started_{false};
  std::atomic<bool>      link_up_{true};
  std::atomic<unsigned>  fail_writes_{0};
  std::atomic<std::size_t> sent_{0};
  std::atomic<std::size_t> dropped_{0};
  LoopbackTransport*     peer_{nullptr};
  std::mutex             filter_mu_;
  DropFilter             drop_{};
};

} // namespace transport
