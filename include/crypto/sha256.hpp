#pragma once

#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace fwbundle {

using Sha256Digest = std::array<std::uint8_t, 32>;

std::string HexEncode(std::span<const std::uint8_t> bytes);

std::string Sha256Hex(std::span<const std::uint8_t> data);
Result Sha256HexFile(const std::string& path, std::string& out_hex);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    // False if the context failed at any point or was already finalized.
    bool Final(Sha256Digest& out);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fwbundle
