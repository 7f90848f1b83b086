#include "provmark/record_store.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>

#include "provmark/crypto.hpp"
#include "provmark/encoding.hpp"
#include "provmark/errors.hpp"
#include "provmark/timestamp.hpp"

namespace ProvMark {

namespace {

constexpr size_t RECORD_ID_BYTES = 16;

std::string new_record_id() {
    return Encoding::to_hex(Crypto::random_bytes(RECORD_ID_BYTES));
}

} // namespace

// --- InMemoryRecordStore ---

bool InMemoryRecordStore::insert_locked(ProvenanceRecord record) {
    Entry entry;
    entry.signed_at_millis = Timestamp::parse_iso8601_millis(record.signed_at);
    const std::string id = record.id;
    entry.record = std::move(record);
    return records_.emplace(id, std::move(entry)).second;
}

std::string InMemoryRecordStore::create(ProvenanceRecord record) {
    // Validate before taking the lock; nothing below may partially apply.
    Timestamp::parse_iso8601_millis(record.signed_at);
    if (record.created_at.empty()) {
        record.created_at = Timestamp::now_iso8601();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (record.id.empty()) {
        do {
            record.id = new_record_id();
        } while (records_.count(record.id) != 0);
    } else if (records_.count(record.id) != 0) {
        throw LogicError("Record id already exists: " + record.id);
    }

    const std::string id = record.id;
    insert_locked(std::move(record));
    try {
        persist_locked();
    } catch (const std::exception&) {
        records_.erase(id);
        throw;
    }
    return id;
}

std::vector<ProvenanceRecord> InMemoryRecordStore::find_by_content_hash(const std::string& content_hash) const {
    std::vector<const Entry*> hits;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : records_) {
        if (entry.record.content_hash == content_hash) {
            hits.push_back(&entry);
        }
    }
    std::stable_sort(hits.begin(), hits.end(),
                     [](const Entry* a, const Entry* b) { return a->signed_at_millis < b->signed_at_millis; });

    std::vector<ProvenanceRecord> out;
    out.reserve(hits.size());
    for (const Entry* entry : hits) {
        out.push_back(entry->record);
    }
    return out;
}

std::vector<ProvenanceRecord> InMemoryRecordStore::find_all_with_perceptual_hash() const {
    std::vector<ProvenanceRecord> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : records_) {
        if (entry.record.perceptual_hash) {
            out.push_back(entry.record);
        }
    }
    return out;
}

std::optional<ProvenanceRecord> InMemoryRecordStore::find_by_id(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

bool InMemoryRecordStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }

    Entry removed = std::move(it->second);
    records_.erase(it);
    try {
        persist_locked();
    } catch (const std::exception&) {
        records_.emplace(id, std::move(removed));
        throw;
    }
    return true;
}

std::vector<ProvenanceRecord> InMemoryRecordStore::list_recent(size_t limit) const {
    std::vector<const Entry*> all;
    std::lock_guard<std::mutex> lock(mutex_);
    all.reserve(records_.size());
    for (const auto& [id, entry] : records_) {
        all.push_back(&entry);
    }
    std::stable_sort(all.begin(), all.end(),
                     [](const Entry* a, const Entry* b) { return a->signed_at_millis > b->signed_at_millis; });

    std::vector<ProvenanceRecord> out;
    for (size_t i = 0; i < all.size() && i < limit; ++i) {
        out.push_back(all[i]->record);
    }
    return out;
}

size_t InMemoryRecordStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

// --- JsonFileRecordStore ---

JsonFileRecordStore::JsonFileRecordStore(std::string path) : path_(std::move(path)) {
    load();
}

void JsonFileRecordStore::load() {
    std::ifstream in(path_);
    if (!in) {
        return;  // Nothing stored yet
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw StoreError("Cannot parse record store " + path_ + ": " + e.what());
    }
    if (!doc.is_object() || !doc.contains("records") || !doc["records"].is_array()) {
        throw StoreError("Record store " + path_ + " has no records array.");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : doc["records"]) {
        try {
            ProvenanceRecord record = item.get<ProvenanceRecord>();
            if (record.id.empty()) {
                throw MalformedInput("record without id");
            }
            const std::string id = record.id;
            if (!insert_locked(std::move(record))) {
                throw StoreError("Duplicate record id in " + path_ + ": " + id);
            }
        } catch (const MalformedInput& e) {
            throw StoreError("Corrupt record in " + path_ + ": " + e.what());
        }
    }
}

void JsonFileRecordStore::persist_locked() {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& [id, entry] : records_) {
        records.push_back(entry.record);
    }
    nlohmann::json doc{{"schemaVersion", RECORD_SCHEMA_VERSION}, {"records", std::move(records)}};

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw StoreError("Cannot open " + tmp_path + " for writing.");
        }
        out << doc.dump(2);
        out.flush();
        if (!out) {
            throw StoreError("Failed writing " + tmp_path + ".");
        }
    }
    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        std::remove(tmp_path.c_str());
        throw StoreError("Cannot replace " + path_ + ".");
    }
}

} // namespace ProvMark
