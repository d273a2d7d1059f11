#pragma once
#include <chrono>
#include <string>

// Resolves hostname to a numeric address, retrying while DNS is not ready
// (e.g. a cache sidecar still starting). Returns an empty string when every
// attempt failed.
std::string resolveHostWithRetry(const std::string& hostname,
                                 int maxAttempts = 20,
                                 std::chrono::milliseconds delay = std::chrono::milliseconds{500});
