#pragma once

#include "TransferTypes.h"
#include <cstdint>
#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

namespace CipherLink {

/**
 * @brief Random-access reader over an upload payload
 *
 * Reads from TransferFile::bytes when present, otherwise from payloadPath.
 * The file is opened once and kept open for the lifetime of the job.
 */
class PayloadSource {
public:
    /**
     * @throws StorageError(FILE_NOT_FOUND) if neither bytes nor a readable file is given
     */
    explicit PayloadSource(const TransferFile& file);

    PayloadSource(const PayloadSource&) = delete;
    PayloadSource& operator=(const PayloadSource&) = delete;

    uint64_t size() const { return size_; }

    /**
     * @brief Read up to length bytes starting at offset
     * @throws StorageError(FILE_IO_FAILED) on a short or failed read
     */
    std::vector<uint8_t> read(uint64_t offset, std::size_t length);

    /**
     * @brief Plaintext of chunk index under a fixed chunk size
     */
    std::vector<uint8_t> chunk(uint64_t index, uint32_t chunkSize);

    static uint64_t chunkCount(uint64_t totalBytes, uint32_t chunkSize);

private:
    const std::vector<uint8_t>* bytes_ = nullptr;
    std::string path_;
    std::ifstream stream_;
    uint64_t size_ = 0;
};

} // namespace CipherLink
