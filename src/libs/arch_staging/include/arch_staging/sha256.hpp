#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace arch_staging {

// Incremental SHA-256 (FIPS 180-4).
class Sha256 {
public:
    Sha256();

    void update(std::string_view data);
    // Lowercase hex digest. The hasher is reset afterwards.
    std::string final_hex();

    static std::string hash_hex(std::string_view data);

private:
    void process_block(const std::uint8_t* block);
    void reset();

    std::array<std::uint32_t, 8> state_{};
    std::array<std::uint8_t, 64> buffer_{};
    std::size_t buffered_ = 0;
    std::uint64_t total_bytes_ = 0;
};

// "sha256:<64 hex>"
std::string content_hash(std::string_view data);

} // namespace arch_staging
