#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace CipherLink {

/**
 * @brief Picks the chunk size of the next job from measured throughput
 *
 * Ladder: 32 KiB, 128 KiB, 512 KiB, 1 MiB.
 *   >= 2 MiB/s   -> 1 MiB
 *   >= 512 KiB/s -> 512 KiB
 *   >= 128 KiB/s -> 128 KiB
 *   otherwise    -> 32 KiB
 * A running job keeps the size it committed to.
 */
class ChunkSizer {
public:
    static constexpr uint32_t KIB = 1024;
    static constexpr std::array<uint32_t, 4> LADDER{32 * KIB, 128 * KIB, 512 * KIB, 1024 * KIB};

    explicit ChunkSizer(uint32_t initial = 128 * KIB) : next_(initial) {}

    static uint32_t tierFor(double bytesPerMs);

    void recordChunk(std::size_t bytes, std::chrono::milliseconds elapsed);

    uint32_t nextChunkSize() const { return next_.load(); }

private:
    std::atomic<uint32_t> next_;
};

} // namespace CipherLink
