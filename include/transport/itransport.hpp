#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "util/constants.hpp"

namespace transport
{

using Frame   = std::vector<std::uint8_t>;
using OnFrame = std::function<void(const Frame &)>;

struct Settings
{
    std::string role = "loopback";
    std::size_t max_frame = constants::MAX_PARCEL_SIZE;  // 0 = unlimited
};

// One connected peer. send() is a single link write; the engine owns all pacing.
struct ITransport
{
    virtual bool        start(const Settings &s, OnFrame on_rx) = 0;
    virtual bool        send(const Frame &one_parcel)           = 0;
    virtual void        stop()                                  = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
