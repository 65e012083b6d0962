#include "ChunkSizer.h"
#include <algorithm>

namespace CipherLink {

uint32_t ChunkSizer::tierFor(double bytesPerMs) {
    const double bytesPerSecond = bytesPerMs * 1000.0;
    if (bytesPerSecond >= 2.0 * 1024 * 1024) {
        return LADDER[3];
    }
    if (bytesPerSecond >= 512.0 * 1024) {
        return LADDER[2];
    }
    if (bytesPerSecond >= 128.0 * 1024) {
        return LADDER[1];
    }
    return LADDER[0];
}

void ChunkSizer::recordChunk(std::size_t bytes, std::chrono::milliseconds elapsed) {
    const double ms = static_cast<double>(std::max<int64_t>(1, elapsed.count()));
    next_.store(tierFor(static_cast<double>(bytes) / ms));
}

} // namespace CipherLink
