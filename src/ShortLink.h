#pragma once
#include <chrono>
#include <string>

struct ShortLink {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string code;
    std::string originalUrl;
    TimePoint createdAt;
};
