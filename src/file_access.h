#pragma once

#include <mutex>
#include <set>
#include <string>

#include "media_interfaces.h"

// Scoped access backed by POSIX permission checks
class FileAccessProvider : public IAccessProvider
{
public:
    bool startAccessing(const std::string &path, AccessMode mode) override;
    void stopAccessing(const std::string &path) override;

    size_t activeGrants() const;

private:
    mutable std::mutex m_mutex;
    std::multiset<std::string> m_active;
};
