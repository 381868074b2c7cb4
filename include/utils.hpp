#pragma once
#include <chrono>
#include <ctime>
#include <stop_token>
#include <string>
#include <vector>

// Utility functions
bool ends_with(const std::string &value, const std::string &ending);
std::string trim(const std::string &str);

// Splits on every occurrence of delimiter, keeping empty fields ("/a/" -> "", "a", "").
std::vector<std::string> split(const std::string &value, const std::string &delimiter);

// Text after the last '/', or the whole value when there is none.
std::string last_segment(const std::string &value);

std::string to_lower(std::string value);

// Sleeps for the given duration unless stop is requested first. Returns false when interrupted.
bool sleep_for(std::chrono::milliseconds duration, std::stop_token stop);

// Parses "2006-01-02T15:04:05.000Z" style stamps. Returns 0 when empty or malformed.
std::time_t parse_timestamp(const std::string &stamp);
