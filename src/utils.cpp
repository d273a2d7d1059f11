#include "utils.h"

namespace Base62 {
    bool isSymbol(char c) {
        return (c >= '0' && c <= '9') ||
               (c >= 'A' && c <= 'Z') ||
               (c >= 'a' && c <= 'z');
    }

    bool isCode(std::string_view value) {
        if (value.size() != kCodeLength) {
            return false;
        }
        for (char c : value) {
            if (!isSymbol(c)) {
                return false;
            }
        }
        return true;
    }

    std::string encode(uint64_t value, size_t width) {
        std::string result(width, kAlphabet[0]);

        size_t pos = width;
        while (value > 0 && pos > 0) {
            result[--pos] = kAlphabet[value % 62];
            value /= 62;
        }

        return result;
    }
}
