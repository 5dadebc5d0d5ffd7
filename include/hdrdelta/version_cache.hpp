/**
 * @file version_cache.hpp
 * @brief Recency cache of distinct header versions.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _          _            _        _  _
 * | |__    __| | _ __   __| |  ___ | || |_   __ _
 * | '_ \  / _` || '__| / _` | / _ \| || __| / _` |
 * | | | || (_| || |   | (_| ||  __/| || |_ | (_| |
 * |_| |_| \__,_||_|    \__,_| \___||_| \__| \__,_|
 * ============================================================================
 * @endcond
 *
 * Compressor and decompressor each own one cache. The index of a version
 * in the cache is what goes on the wire, so both sides must apply the
 * same mutations in the same order; nothing else keeps them in step.
 * The cache is a plain value: copy it, compare it, feed two instances the
 * same operations and they stay equal.
 *
 * @authors hdrdelta contributors
 *
 * @see https://developer.bitcoin.org/reference/block_chain.html#block-headers Block header layout
 */

#ifndef HDRDELTA_VERSION_CACHE_HPP
#define HDRDELTA_VERSION_CACHE_HPP

#include "config.hpp"

#include <array>
#include <optional>

namespace hdrdelta {

/**
 * @brief Ordered list of up to VERSION_CACHE_SLOTS distinct versions.
 *
 * Slot 0 holds the most recently noted version. Noting a new version when
 * the cache is full evicts the oldest (last) slot.
 */
class VersionCache {
public:
    VersionCache() noexcept = default;

    /**
     * @brief Drop all entries.
     */
    void reset() noexcept;

    /**
     * @brief Initialize with the anchor header's version.
     *
     * Clears any previous contents first.
     */
    void seed(std::uint32_t version) noexcept;

    /**
     * @brief Find the slot holding a version.
     *
     * @return Slot index 0-6, or std::nullopt if not cached
     */
    [[nodiscard]] std::optional<std::uint8_t> index_of(std::uint32_t version) const noexcept;

    /**
     * @brief Push a version to the front, evicting the oldest if full.
     *
     * Only call for a version index_of() did not find; the cache holds
     * distinct values.
     */
    void note_new(std::uint32_t version) noexcept;

    /**
     * @brief Version at a slot.
     *
     * @param index Slot index, must be < size()
     */
    [[nodiscard]] std::uint32_t at(std::size_t index) const noexcept { return slots_[index]; }

    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    bool operator==(const VersionCache& other) const noexcept;

private:
    std::array<std::uint32_t, VERSION_CACHE_SLOTS> slots_{};
    std::size_t size_ = 0;
};

} // namespace hdrdelta

#endif // HDRDELTA_VERSION_CACHE_HPP
