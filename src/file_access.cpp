#include "file_access.h"
#include "logger.h"

#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

static bool can_read(const fs::path &p)
{
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), R_OK) == 0;
}

static bool can_write(const fs::path &p)
{
    std::error_code ec;
    if (fs::exists(p, ec))
        return !fs::is_directory(p, ec) && ::access(p.c_str(), W_OK) == 0;

    fs::path parent = p.parent_path();
    if (parent.empty())
        parent = ".";
    return fs::is_directory(parent, ec) && ::access(parent.c_str(), W_OK | X_OK) == 0;
}

bool FileAccessProvider::startAccessing(const std::string &path, AccessMode mode)
{
    const bool ok = (mode == AccessMode::Read) ? can_read(path) : can_write(path);
    if (!ok)
    {
        LOG_DEBUG("Access denied for %s (%s)", path.c_str(), mode == AccessMode::Read ? "read" : "write");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_active.insert(path);
    return true;
}

void FileAccessProvider::stopAccessing(const std::string &path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(path);
    if (it != m_active.end())
        m_active.erase(it);
    else
        LOG_WARN("Releasing access to %s that was never granted", path.c_str());
}

size_t FileAccessProvider::activeGrants() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.size();
}
