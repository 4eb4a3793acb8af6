#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "util/constants.hpp"

namespace codec
{

// Low nibble of the header flags byte
inline constexpr std::uint8_t ALGO_NONE    = 0x00;
inline constexpr std::uint8_t ALGO_DEFLATE = 0x01;
// 0x02..0x0F reserved

class Compressor
{
  public:
    virtual ~Compressor() = default;

    virtual std::uint8_t     algorithm() const = 0;
    virtual std::string_view name() const      = 0;  // token used in HELLO caps

    virtual bool compress(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) = 0;
    virtual bool decompress(const std::vector<std::uint8_t> &in,
                            std::vector<std::uint8_t>       &out) = 0;
};

// zlib-wrapped DEFLATE stream
class DeflateCompressor : public Compressor
{
  public:
    explicit DeflateCompressor(std::size_t max_output = constants::MAX_INFLATED_SIZE)
        : max_output_(max_output)
    {
    }

    std::uint8_t     algorithm() const override { return ALGO_DEFLATE; }
    std::string_view name() const override { return "deflate"; }

    bool compress(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) override;
    bool decompress(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out) override;

  private:
    std::size_t max_output_;
};

}  // namespace codec
