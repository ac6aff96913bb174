#ifndef KOI_CACHE_HPP_
#define KOI_CACHE_HPP_

#include <koi/pixel.hpp>

#include <array>
#include <cstddef>
#include <cstdint>

namespace koi {

// ============================================================================
// Recent-Colors Cache
// ============================================================================

/**
 * Direct-mapped table of the 64 most recently seen colors, keyed by
 * pixel_hash(). Encoder and decoder each own one and must apply the same
 * sequence of store() calls so both tables stay identical.
 */
class color_cache {
public:
    [[nodiscard]] const pixel& lookup(std::size_t index) const noexcept {
        return slots_[index % CACHE_SIZE];
    }

    [[nodiscard]] bool contains(const pixel& px) const noexcept {
        return slots_[pixel_hash(px)] == px;
    }

    // Overwrites the slot owned by px and returns its index
    std::uint8_t store(const pixel& px) noexcept {
        const std::uint8_t index = pixel_hash(px);
        slots_[index] = px;
        return index;
    }

    void clear() noexcept { slots_.fill(pixel{}); }

    [[nodiscard]] const std::array<pixel, CACHE_SIZE>& slots() const noexcept { return slots_; }

    friend bool operator==(const color_cache&, const color_cache&) noexcept = default;

private:
    std::array<pixel, CACHE_SIZE> slots_{};
};

} // namespace koi

#endif // KOI_CACHE_HPP_
