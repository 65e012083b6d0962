#include "PayloadSource.h"
#include "Errors.h"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace CipherLink {

PayloadSource::PayloadSource(const TransferFile& file) {
    if (!file.bytes.empty() || file.payloadPath.empty()) {
        bytes_ = &file.bytes;
        size_ = file.bytes.size();
        return;
    }

    path_ = file.payloadPath;
    std::error_code ec;
    auto fileSize = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw StorageError(Core::ErrorCode::FILE_NOT_FOUND, "Cannot stat payload " + path_ + ": " + ec.message());
    }
    stream_.open(path_, std::ios::binary);
    if (!stream_.is_open()) {
        throw StorageError(Core::ErrorCode::FILE_NOT_FOUND, "Cannot open payload " + path_);
    }
    size_ = static_cast<uint64_t>(fileSize);
}

std::vector<uint8_t> PayloadSource::read(uint64_t offset, std::size_t length) {
    if (offset > size_) {
        throw StorageError(Core::ErrorCode::FILE_IO_FAILED, "Read past end of payload");
    }
    length = static_cast<std::size_t>(std::min<uint64_t>(length, size_ - offset));

    if (bytes_) {
        auto begin = bytes_->begin() + static_cast<std::ptrdiff_t>(offset);
        return std::vector<uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(length));
    }

    std::vector<uint8_t> buffer(length);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(stream_.gcount()) != length) {
        throw StorageError(Core::ErrorCode::FILE_IO_FAILED,
                           "Short read from " + path_ + " at offset " + std::to_string(offset));
    }
    return buffer;
}

std::vector<uint8_t> PayloadSource::chunk(uint64_t index, uint32_t chunkSize) {
    return read(index * chunkSize, chunkSize);
}

uint64_t PayloadSource::chunkCount(uint64_t totalBytes, uint32_t chunkSize) {
    if (chunkSize == 0) {
        return 0;
    }
    return (totalBytes + chunkSize - 1) / chunkSize;
}

} // namespace CipherLink
