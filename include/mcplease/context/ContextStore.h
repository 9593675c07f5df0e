//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextStore.h
// Purpose: Per-session conversation context (bounded history, idle expiry)
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcplease/JSONRPCTypes.h"

namespace mcplease {
namespace context {

struct ConversationEntry {
    std::string role;  // "user", "assistant", "system"
    std::string content;
    std::chrono::system_clock::time_point timestamp;
    std::unordered_map<std::string, std::string> metadata;
};

struct ConversationContext {
    std::string sessionId;
    std::optional<std::string> userId;
    std::vector<ConversationEntry> history;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point lastAccessed;
};

//==========================================================================================================
// IContextStore
// Purpose: Storage seam for conversation context. The orchestrator only appends and reads.
//==========================================================================================================
class IContextStore {
public:
    virtual ~IContextStore() = default;

    // Creates the context on first use. Returns false when the entry was not stored.
    virtual bool AppendEntry(const std::string& sessionId,
                             const std::optional<std::string>& userId,
                             ConversationEntry entry) = 0;
    virtual std::optional<ConversationContext> GetContext(const std::string& sessionId) = 0;
    virtual bool DeleteContext(const std::string& sessionId) = 0;
    virtual std::size_t CleanupExpired() = 0;
    // Caps stored entry text (degradation); 0 disables the cap.
    virtual void SetMaxContentSize(std::size_t chars) = 0;
    virtual JSONValue GetStats() const = 0;
};

//==========================================================================================================
// InMemoryContextStore
// Purpose: Process-local IContextStore.
// Notes:
//   - Mutation of one session's context is serialized by that session's own mutex; the table lock is
//     only held to find or insert the record.
//   - History keeps the newest kMaxEntries entries; a context idle longer than maxAge is expired.
//==========================================================================================================
class InMemoryContextStore : public IContextStore {
public:
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;
    static constexpr std::size_t kMaxEntries = 50;

    struct Options {
        std::chrono::minutes maxAge{30};
        TimeSource now;
    };

    InMemoryContextStore();
    explicit InMemoryContextStore(Options opts);

    bool AppendEntry(const std::string& sessionId,
                     const std::optional<std::string>& userId,
                     ConversationEntry entry) override;
    std::optional<ConversationContext> GetContext(const std::string& sessionId) override;
    bool DeleteContext(const std::string& sessionId) override;
    std::size_t CleanupExpired() override;
    void SetMaxContentSize(std::size_t chars) override;
    JSONValue GetStats() const override;

private:
    struct Record {
        std::mutex mtx;
        ConversationContext ctx;
    };

    std::chrono::system_clock::time_point now() const;
    std::shared_ptr<Record> find(const std::string& sessionId) const;

    Options options;
    mutable std::mutex tableMutex;
    std::unordered_map<std::string, std::shared_ptr<Record>> records;
    std::size_t maxContentSize{0};
};

// Longest prefix of `text` within `maxBytes` that ends on a UTF-8 character boundary.
std::string TruncateUtf8(const std::string& text, std::size_t maxBytes);

} // namespace context
} // namespace mcplease
