#pragma once
#include <string>
#include <string_view>
#include <cstdint>

namespace Base62 {
    inline constexpr std::string_view kAlphabet =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

    inline constexpr size_t kCodeLength = 6;

    bool isSymbol(char c);

    // True when value could have been produced as a short code.
    bool isCode(std::string_view value);

    // Fixed-width rendering, most significant symbol first; overflow is truncated.
    std::string encode(uint64_t value, size_t width = kCodeLength);
}
