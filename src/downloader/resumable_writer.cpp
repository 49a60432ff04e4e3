/*
 * resumable_writer.cpp
 *
 * Appends (resume) or truncates (fresh start) the destination file and copies
 * the body stream into it chunk by chunk. The partial file is never removed here;
 * the next attempt picks it up again.
 */

#include <snapfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <vector>

namespace snapfetch::downloader {

namespace fs = std::filesystem;

ResumableWriter::ResumableWriter(std::size_t chunkSizeBytes)
    : chunkSize_(chunkSizeBytes == 0 ? kDefaultChunkSizeBytes : chunkSizeBytes) {}

Result<std::uint64_t>
ResumableWriter::stream(IByteStream& source, const fs::path& destination,
                        std::uint64_t existingBytes, std::uint64_t totalBytes,
                        const std::function<void(std::uint64_t, std::uint64_t)>& onChunk,
                        const ShouldCancel& shouldCancel) const {
    const bool append = existingBytes > 0;
    const auto mode = std::ios::binary | std::ios::out | (append ? std::ios::app : std::ios::trunc);

    std::ofstream os(destination, mode);
    if (!os.is_open()) {
        return Error{ErrorCode::IoError, std::string("Failed to open ") + destination.string() +
                                             (append ? " for append" : " for writing")};
    }
    spdlog::trace("{} {} at byte {}", append ? "Appending to" : "Writing", destination.string(),
                  existingBytes);

    std::vector<std::byte> buffer(chunkSize_);
    std::uint64_t position = existingBytes;

    while (true) {
        if (shouldCancel && shouldCancel()) {
            os.close();
            return Error{ErrorCode::OperationCancelled,
                         "Transfer cancelled at byte " + std::to_string(position)};
        }

        auto got = source.read(buffer);
        if (!got) {
            os.close();
            return got.error();
        }
        const auto n = got.value();
        if (n == 0) {
            break;
        }

        os.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(n));
        if (!os.good()) {
            return Error{ErrorCode::IoError, "Write failed for " + destination.string() +
                                                 " at byte " + std::to_string(position)};
        }
        position += n;
        if (onChunk) {
            onChunk(position, totalBytes);
        }
    }

    os.flush();
    os.close();
    if (os.fail()) {
        return Error{ErrorCode::IoError, "Failed to flush/close " + destination.string()};
    }
    return position;
}

} // namespace snapfetch::downloader
