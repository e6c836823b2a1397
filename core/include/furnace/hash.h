#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace furnace::hash {

// ---------- SHA-256 (crypto hash) ----------
// Purpose: artifact identifiers, state digests, tamper-evident log chains.

class Sha256 {
public:
    Sha256();
    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }
    std::array<uint8_t, 32> finish();
    std::string finish_hex();

private:
    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_{0};
    bool done_{false};
};

std::string to_hex(const uint8_t* data, size_t n);

std::array<uint8_t, 32> sha256_bytes(const uint8_t* data, size_t n);
std::string sha256_hex(const std::string& s);

// Streams the file in 64 KiB chunks. nullopt if unreadable.
std::optional<std::string> sha256_file_hex(const std::filesystem::path& p);

// 64 zero characters; the chain_prev of the first record in a chain.
inline std::string zero_chain() { return std::string(64, '0'); }

} // namespace furnace::hash
