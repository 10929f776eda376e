#include "utils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

// Check if a string ends with a suffix
bool endsWith(const std::string &str, const std::string &suffix)
{
    if (suffix.size() > str.size())
        return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Convert string to lowercase (returns a copy)
std::string lowercase_copy(const std::string &s)
{
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string format_elapsed(double seconds)
{
    if (!(seconds > 0.0))
        return "0s";

    long long total = std::llround(seconds);
    const long long h = total / 3600;
    const long long m = (total % 3600) / 60;
    const long long s = total % 60;

    std::string out;
    char part[32];
    if (h > 0)
    {
        snprintf(part, sizeof(part), "%lldh", h);
        out += part;
    }
    if (m > 0)
    {
        snprintf(part, sizeof(part), "%s%lldm", out.empty() ? "" : " ", m);
        out += part;
    }
    if (s > 0 || out.empty())
    {
        snprintf(part, sizeof(part), "%s%llds", out.empty() ? "" : " ", s);
        out += part;
    }
    return out;
}

std::string format_byte_count(uint64_t bytes)
{
    char buf[64];
    if (bytes < 1000)
    {
        snprintf(buf, sizeof(buf), "%llu bytes", static_cast<unsigned long long>(bytes));
        return buf;
    }

    static const char *const units[] = {"KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes) / 1000.0;
    int unit = 0;
    while (value >= (unit == 0 ? 999.5 : 999.95) && unit < 3)
    {
        value /= 1000.0;
        ++unit;
    }

    // KB without decimals, MB with one, GB and above with two
    if (unit == 0)
        snprintf(buf, sizeof(buf), "%.0f %s", value, units[unit]);
    else if (unit == 1)
        snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    else
        snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    return buf;
}
