#pragma once
#include <stdexcept>
#include <utility>
#include <string>

// Raised by LinkStore backends when the backing store cannot be reached or
// rejects a request for reasons other than a key conflict.
class StoreUnavailable : public std::runtime_error {
public:
    explicit StoreUnavailable(std::string message)
        : std::runtime_error(std::move(message)) {}
};
