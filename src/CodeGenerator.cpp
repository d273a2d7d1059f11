#include "CodeGenerator.h"
#include "utils.h"
#include <openssl/rand.h>
#include <stdexcept>

namespace {
// Largest multiple of 62 that fits in a byte; higher bytes are rejected so
// every symbol keeps probability 1/62.
constexpr unsigned int kRejectionBound = 62 * 4;
constexpr size_t kBatchBytes = 16;
}

std::string RandomCodeGenerator::nextCandidate() {
    std::string code;
    code.reserve(Base62::kCodeLength);

    unsigned char buffer[kBatchBytes];
    while (code.size() < Base62::kCodeLength) {
        fillRandom(buffer, sizeof(buffer));
        for (size_t i = 0; i < sizeof(buffer) && code.size() < Base62::kCodeLength; ++i) {
            if (buffer[i] >= kRejectionBound) {
                continue;
            }
            code.push_back(Base62::kAlphabet[buffer[i] % 62]);
        }
    }
    return code;
}

void RandomCodeGenerator::fillRandom(unsigned char* buffer, size_t length) {
    if (RAND_bytes(buffer, static_cast<int>(length)) != 1) {
        throw std::runtime_error("unable to generate random code");
    }
}
