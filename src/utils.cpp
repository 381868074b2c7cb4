#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

// Function to check if a string ends with a particular suffix
bool ends_with(const std::string &value, const std::string &ending)
{
    if (ending.size() > value.size())
        return false;

    return std::equal(ending.rbegin(), ending.rend(), value.rbegin());
}

// Function to trim leading and trailing whitespace from a string
std::string trim(const std::string &str)
{
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start)))
        start++;

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1))))
        end--;

    return std::string(start, end);
}

std::vector<std::string> split(const std::string &value, const std::string &delimiter)
{
    std::vector<std::string> parts;
    if (delimiter.empty())
    {
        parts.push_back(value);
        return parts;
    }

    size_t start = 0;
    size_t pos;
    while ((pos = value.find(delimiter, start)) != std::string::npos)
    {
        parts.push_back(value.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    parts.push_back(value.substr(start));
    return parts;
}

std::string last_segment(const std::string &value)
{
    auto pos = value.rfind('/');
    if (pos == std::string::npos)
        return value;
    return value.substr(pos + 1);
}

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool sleep_for(std::chrono::milliseconds duration, std::stop_token stop)
{
    if (duration.count() <= 0)
        return !stop.stop_requested();

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    // Nothing notifies cv: the wait ends on timeout or on a stop request
    (void)cv.wait_for(lock, stop, duration, []
                      { return false; });
    return !stop.stop_requested();
}

std::time_t parse_timestamp(const std::string &stamp)
{
    if (stamp.empty())
        return 0;

    std::tm tm{};
    std::istringstream in(stamp);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail())
        return 0;

    return timegm(&tm);
}
