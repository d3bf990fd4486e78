#pragma once

#include "session/Store.hpp"

#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace sk::test {

class MemoryStore : public session::Store {
public:
    void put(const std::string& key, const session::Bytes& value) override {
        std::unique_lock lock(mutex_);
        entries_[key] = value;
        ++puts_;
    }

    std::optional<session::Bytes> get(const std::string& key) override {
        std::shared_lock lock(mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] size_t puts() const {
        std::shared_lock lock(mutex_);
        return puts_;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        std::shared_lock lock(mutex_);
        return entries_.contains(key);
    }

    void putRaw(const std::string& key, const std::string& value) {
        put(key, session::Bytes(value.begin(), value.end()));
    }

    [[nodiscard]] std::string raw(const std::string& key) const {
        std::shared_lock lock(mutex_);
        const auto& v = entries_.at(key);
        return {v.begin(), v.end()};
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, session::Bytes> entries_;
    size_t puts_ = 0;
};

struct StoreUnavailable : std::runtime_error {
    StoreUnavailable() : std::runtime_error("backend unavailable") {}
};

class FailingStore : public session::Store {
public:
    bool failPut = true, failGet = true;

    void put(const std::string&, const session::Bytes&) override {
        if (failPut) throw StoreUnavailable();
    }

    std::optional<session::Bytes> get(const std::string&) override {
        if (failGet) throw StoreUnavailable();
        return session::Bytes{};
    }
};

}
