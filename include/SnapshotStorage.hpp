#ifndef SNAPSHOT_STORAGE_HPP
#define SNAPSHOT_STORAGE_HPP

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <fcntl.h>  // for open flags
#include <unistd.h> // for close, pwrite, fsync
#include <cerrno>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <algorithm>

/**
 * @brief Durable home of snapshot frames
 *
 * Each write produces a new segment `<baseFilename>_<NNNNNN>.snap` in
 * basePath. The frame is written to a temporary file, fsynced and renamed
 * into place, so a reader only ever sees complete segments. Once the new
 * segment is durable, all but the newest `retainedSnapshots` segments are
 * removed.
 */
class SnapshotStorage
{
public:
    SnapshotStorage(const std::string &basePath,
                    const std::string &baseFilename,
                    size_t maxAttempts = 5,
                    std::chrono::milliseconds baseRetryDelay = std::chrono::milliseconds(1),
                    size_t retainedSnapshots = 1);

    // Returns the number of bytes written.
    size_t write(std::vector<uint8_t> &&frame);

    std::optional<std::vector<uint8_t>> readLatest() const;

    // Indices of the segments on disk, ascending.
    std::vector<size_t> listSnapshotIndices() const;

    std::string generateSnapshotPath(size_t snapshotIndex) const;

private:
    std::string m_basePath;
    std::string m_baseFilename;
    size_t m_maxAttempts;
    std::chrono::milliseconds m_baseRetryDelay;
    size_t m_retainedSnapshots;
    size_t m_nextIndex;
    std::mutex m_writeMutex; // one snapshot write at a time

    void pruneOldSnapshots();

    // Retry helpers use member-configured parameters
    template <typename Func>
    auto retryWithBackoff(Func &&f)
    {
        for (size_t attempt = 1;; ++attempt)
        {
            try
            {
                return f();
            }
            catch (const std::runtime_error &)
            {
                if (attempt >= m_maxAttempts)
                    throw;
                // Factor saturates at 2^30
                int64_t factor = int64_t(1) << std::min<size_t>(attempt - 1, 30);
                auto delay = m_baseRetryDelay * factor;
                std::this_thread::sleep_for(delay);
            }
        }
    }

    int openWithRetry(const char *path, int flags, mode_t mode)
    {
        return retryWithBackoff([&]()
                                {
            int fd = ::open(path, flags, mode);
            if (fd < 0) throw std::runtime_error(std::string("open failed: ") + path);
            return fd; });
    }

    size_t pwriteFull(int fd, const uint8_t *buf, size_t count, off_t offset)
    {
        size_t total = 0;
        while (total < count)
        {
            ssize_t written = ::pwrite(fd, buf + total, count - total, offset + total);
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                throw std::runtime_error("pwrite failed");
            }
            total += written;
        }
        return total;
    }

    void fsyncRetry(int fd)
    {
        retryWithBackoff([&]()
                         {
            if (::fsync(fd) < 0) throw std::runtime_error("fsync failed");
            return 0; });
    }
};

#endif
