#pragma once
#include <string>

// Source of candidate short codes. Implementations do not guarantee
// uniqueness; the store's conditional insert does.
class CodeGenerator {
public:
    virtual ~CodeGenerator() = default;

    virtual std::string nextCandidate() = 0;
};

// Uniform draw over the 62-symbol alphabet, fed by OpenSSL's CSPRNG.
class RandomCodeGenerator : public CodeGenerator {
public:
    std::string nextCandidate() override;

private:
    static void fillRandom(unsigned char* buffer, size_t length);
};
