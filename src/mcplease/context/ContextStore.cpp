//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextStore.cpp
// Purpose: InMemoryContextStore implementation
//==========================================================================================================

#include "mcplease/context/ContextStore.h"

#include "logging/Logger.h"

namespace mcplease {
namespace context {

std::string TruncateUtf8(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    std::size_t end = maxBytes;
    // Back off continuation bytes (10xxxxxx) so the cut lands before a lead byte
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return text.substr(0, end);
}

InMemoryContextStore::InMemoryContextStore() : InMemoryContextStore(Options{}) {}

InMemoryContextStore::InMemoryContextStore(Options opts) : options(std::move(opts)) {}

std::chrono::system_clock::time_point InMemoryContextStore::now() const {
    return options.now ? options.now() : std::chrono::system_clock::now();
}

std::shared_ptr<InMemoryContextStore::Record> InMemoryContextStore::find(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(tableMutex);
    auto it = records.find(sessionId);
    return it == records.end() ? nullptr : it->second;
}

bool InMemoryContextStore::AppendEntry(const std::string& sessionId,
                                       const std::optional<std::string>& userId,
                                       ConversationEntry entry) {
    if (sessionId.empty()) {
        return false;
    }
    const auto t = now();
    std::shared_ptr<Record> rec;
    std::size_t cap = 0;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        cap = maxContentSize;
        auto& slot = records[sessionId];
        if (!slot) {
            slot = std::make_shared<Record>();
            slot->ctx.sessionId = sessionId;
            slot->ctx.userId = userId;
            slot->ctx.createdAt = t;
            slot->ctx.lastAccessed = t;
            LOG_DEBUG("Created context for session: {}", sessionId);
        }
        rec = slot;
    }

    std::lock_guard<std::mutex> lock(rec->mtx);
    if (t - rec->ctx.lastAccessed > options.maxAge) {
        // Stale context: start over rather than extending an expired conversation
        rec->ctx.history.clear();
        rec->ctx.createdAt = t;
    }
    if (cap > 0 && entry.content.size() > cap) {
        entry.content = TruncateUtf8(entry.content, cap);
    }
    if (entry.timestamp == std::chrono::system_clock::time_point{}) {
        entry.timestamp = t;
    }
    rec->ctx.history.push_back(std::move(entry));
    if (rec->ctx.history.size() > kMaxEntries) {
        rec->ctx.history.erase(rec->ctx.history.begin(),
                               rec->ctx.history.end() - static_cast<std::ptrdiff_t>(kMaxEntries));
    }
    rec->ctx.lastAccessed = t;
    return true;
}

std::optional<ConversationContext> InMemoryContextStore::GetContext(const std::string& sessionId) {
    auto rec = find(sessionId);
    if (!rec) {
        return std::nullopt;
    }
    const auto t = now();
    {
        std::lock_guard<std::mutex> lock(rec->mtx);
        if (t - rec->ctx.lastAccessed <= options.maxAge) {
            rec->ctx.lastAccessed = t;
            return rec->ctx;
        }
    }
    DeleteContext(sessionId);
    LOG_DEBUG("Context expired for session: {}", sessionId);
    return std::nullopt;
}

bool InMemoryContextStore::DeleteContext(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(tableMutex);
    return records.erase(sessionId) > 0;
}

std::size_t InMemoryContextStore::CleanupExpired() {
    const auto t = now();
    std::vector<std::shared_ptr<Record>> snapshot;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        for (const auto& [id, rec] : records) {
            ids.push_back(id);
            snapshot.push_back(rec);
        }
    }
    std::vector<std::string> expired;
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
        std::lock_guard<std::mutex> lock(snapshot[i]->mtx);
        if (t - snapshot[i]->ctx.lastAccessed > options.maxAge) expired.push_back(ids[i]);
    }
    for (const auto& id : expired) DeleteContext(id);
    if (!expired.empty()) {
        LOG_INFO("Cleaned up {} expired contexts", expired.size());
    }
    return expired.size();
}

void InMemoryContextStore::SetMaxContentSize(std::size_t chars) {
    std::lock_guard<std::mutex> lock(tableMutex);
    maxContentSize = chars;
}

JSONValue InMemoryContextStore::GetStats() const {
    std::size_t contexts = 0;
    std::size_t entries = 0;
    std::vector<std::shared_ptr<Record>> snapshot;
    {
        std::lock_guard<std::mutex> lock(tableMutex);
        contexts = records.size();
        for (const auto& [id, rec] : records) snapshot.push_back(rec);
    }
    for (const auto& rec : snapshot) {
        std::lock_guard<std::mutex> lock(rec->mtx);
        entries += rec->ctx.history.size();
    }
    JSONValue stats{JSONValue::Object{}};
    SetMember(stats, "total_contexts", JSONValue(static_cast<int64_t>(contexts)));
    SetMember(stats, "total_entries", JSONValue(static_cast<int64_t>(entries)));
    SetMember(stats, "max_context_age_minutes", JSONValue(static_cast<int64_t>(options.maxAge.count())));
    SetMember(stats, "max_entries_per_context", JSONValue(static_cast<int64_t>(kMaxEntries)));
    return stats;
}

} // namespace context
} // namespace mcplease
