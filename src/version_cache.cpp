/**
 * @file version_cache.cpp
 * @brief Version recency cache.
 */

#include <hdrdelta/version_cache.hpp>

namespace hdrdelta {

void VersionCache::reset() noexcept {
    slots_.fill(0);
    size_ = 0;
}

void VersionCache::seed(std::uint32_t version) noexcept {
    reset();
    note_new(version);
}

std::optional<std::uint8_t> VersionCache::index_of(std::uint32_t version) const noexcept {
    for (std::size_t i = 0; i < size_; ++i) {
        if (slots_[i] == version) {
            return static_cast<std::uint8_t>(i);
        }
    }
    return std::nullopt;
}

void VersionCache::note_new(std::uint32_t version) noexcept {
    // Shift right by one; when full the tail entry falls off
    std::size_t last = (size_ < VERSION_CACHE_SLOTS) ? size_ : VERSION_CACHE_SLOTS - 1;
    for (std::size_t i = last; i > 0; --i) {
        slots_[i] = slots_[i - 1];
    }
    slots_[0] = version;

    if (size_ < VERSION_CACHE_SLOTS) {
        ++size_;
    }
}

bool VersionCache::operator==(const VersionCache& other) const noexcept {
    if (size_ != other.size_) {
        return false;
    }
    for (std::size_t i = 0; i < size_; ++i) {
        if (slots_[i] != other.slots_[i]) {
            return false;
        }
    }
    return true;
}

} // namespace hdrdelta
