#include "SnapshotStorage.hpp"
#include <iomanip>
#include <sstream>
#include <fstream>
#include <algorithm>
#include <iostream>
#include <cctype>

namespace
{
    const std::string SNAPSHOT_EXTENSION = ".snap";
    const std::string TEMP_SUFFIX = ".tmp";
}

SnapshotStorage::SnapshotStorage(const std::string &basePath,
                                 const std::string &baseFilename,
                                 size_t maxAttempts,
                                 std::chrono::milliseconds baseRetryDelay,
                                 size_t retainedSnapshots)
    : m_basePath(basePath),
      m_baseFilename(baseFilename),
      m_maxAttempts(maxAttempts),
      m_baseRetryDelay(baseRetryDelay),
      m_retainedSnapshots(std::max<size_t>(1, retainedSnapshots)),
      m_nextIndex(0)
{
    std::filesystem::create_directories(m_basePath);

    std::vector<size_t> indices = listSnapshotIndices();
    if (!indices.empty())
    {
        m_nextIndex = indices.back() + 1;
    }
}

std::vector<size_t> SnapshotStorage::listSnapshotIndices() const
{
    std::vector<size_t> indices;
    std::string pattern = m_baseFilename + "_";

    try
    {
        for (const auto &entry : std::filesystem::directory_iterator(m_basePath))
        {
            if (!entry.is_regular_file())
            {
                continue;
            }

            // Expected format: baseFilename_NNNNNN.snap
            std::string name = entry.path().filename().string();
            if (name.compare(0, pattern.size(), pattern) != 0 ||
                name.size() <= pattern.size() + SNAPSHOT_EXTENSION.size() ||
                name.compare(name.size() - SNAPSHOT_EXTENSION.size(), SNAPSHOT_EXTENSION.size(), SNAPSHOT_EXTENSION) != 0)
            {
                continue;
            }

            std::string indexStr = name.substr(pattern.size(),
                                               name.size() - pattern.size() - SNAPSHOT_EXTENSION.size());
            if (indexStr.empty() || !std::all_of(indexStr.begin(), indexStr.end(), [](unsigned char c)
                                                        { return std::isdigit(c) != 0; }))
            {
                continue;
            }
            indices.push_back(static_cast<size_t>(std::stoull(indexStr)));
        }
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        std::cerr << "SnapshotStorage: Cannot list " << m_basePath << ": " << e.what() << std::endl;
    }

    std::sort(indices.begin(), indices.end());
    return indices;
}

std::string SnapshotStorage::generateSnapshotPath(size_t snapshotIndex) const
{
    std::stringstream ss;
    ss << m_basePath << "/";
    ss << m_baseFilename << "_";
    ss << std::setw(6) << std::setfill('0') << snapshotIndex << SNAPSHOT_EXTENSION;
    return ss.str();
}

size_t SnapshotStorage::write(std::vector<uint8_t> &&frame)
{
    std::lock_guard<std::mutex> lock(m_writeMutex);

    std::string finalPath = generateSnapshotPath(m_nextIndex);
    std::string tempPath = finalPath + TEMP_SUFFIX;

    int fd = openWithRetry(tempPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    try
    {
        pwriteFull(fd, frame.data(), frame.size(), 0);
        fsyncRetry(fd);
    }
    catch (const std::runtime_error &)
    {
        ::close(fd);
        std::error_code removeEc;
        std::filesystem::remove(tempPath, removeEc);
        throw;
    }
    ::close(fd);

    std::error_code ec;
    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec)
    {
        std::error_code removeEc;
        std::filesystem::remove(tempPath, removeEc);
        throw std::runtime_error("Failed to publish snapshot " + finalPath + ": " + ec.message());
    }

    // Make the rename itself durable
    int dirFd = openWithRetry(m_basePath.c_str(), O_RDONLY | O_DIRECTORY, 0);
    try
    {
        fsyncRetry(dirFd);
    }
    catch (const std::runtime_error &)
    {
        ::close(dirFd);
        throw;
    }
    ::close(dirFd);

    ++m_nextIndex;
    pruneOldSnapshots();
    return frame.size();
}

void SnapshotStorage::pruneOldSnapshots()
{
    // Called with m_writeMutex already locked
    std::vector<size_t> indices = listSnapshotIndices();
    if (indices.size() <= m_retainedSnapshots)
    {
        return;
    }

    for (size_t i = 0; i + m_retainedSnapshots < indices.size(); ++i)
    {
        std::error_code ec;
        std::filesystem::remove(generateSnapshotPath(indices[i]), ec);
        if (ec)
        {
            std::cerr << "SnapshotStorage: Failed to remove old snapshot " << indices[i]
                      << ": " << ec.message() << std::endl;
        }
    }
}

std::optional<std::vector<uint8_t>> SnapshotStorage::readLatest() const
{
    std::vector<size_t> indices = listSnapshotIndices();
    if (indices.empty())
    {
        return std::nullopt;
    }

    std::string path = generateSnapshotPath(indices.back());
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to open snapshot " + path);
    }

    std::streamsize fileSize = file.tellg();
    std::vector<uint8_t> buffer(static_cast<size_t>(fileSize));
    file.seekg(0);
    if (!file.read(reinterpret_cast<char *>(buffer.data()), fileSize))
    {
        throw std::runtime_error("Failed to read snapshot " + path);
    }
    return buffer;
}
