#pragma once
#include "../src/CodeGenerator.h"
#include "../src/services/InMemoryLinkStore.h"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// Hands out a fixed sequence of codes, repeating the last one when exhausted.
class ScriptedCodeGenerator : public CodeGenerator {
public:
    explicit ScriptedCodeGenerator(std::vector<std::string> codes)
        : codes_(std::move(codes)) {}

    std::string nextCandidate() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        if (next_ < codes_.size()) {
            return codes_[next_++];
        }
        return codes_.back();
    }

    int calls() const { return calls_; }

private:
    std::mutex mutex_;
    std::vector<std::string> codes_;
    size_t next_{0};
    std::atomic<int> calls_{0};
};

class FailingCodeGenerator : public CodeGenerator {
public:
    std::string nextCandidate() override {
        throw std::runtime_error("unable to generate random code");
    }
};

// In-memory store that records how often each operation ran.
class CountingLinkStore : public InMemoryLinkStore {
public:
    InsertResult insertIfAbsent(const ShortLink& link) override {
        ++inserts;
        return InMemoryLinkStore::insertIfAbsent(link);
    }

    std::optional<ShortLink> get(const std::string& code) const override {
        ++gets;
        return InMemoryLinkStore::get(code);
    }

    std::atomic<int> inserts{0};
    mutable std::atomic<int> gets{0};
};

class AlwaysConflictStore : public LinkStore {
public:
    InsertResult insertIfAbsent(const ShortLink&) override {
        ++inserts;
        return InsertResult::Conflict;
    }

    std::optional<ShortLink> get(const std::string&) const override {
        return std::nullopt;
    }

    bool ping() const override { return true; }

    std::atomic<int> inserts{0};
};

class UnavailableStore : public LinkStore {
public:
    InsertResult insertIfAbsent(const ShortLink&) override {
        ++inserts;
        throw StoreUnavailable("connection refused");
    }

    std::optional<ShortLink> get(const std::string&) const override {
        throw StoreUnavailable("connection refused");
    }

    bool ping() const override { return false; }

    std::atomic<int> inserts{0};
};
