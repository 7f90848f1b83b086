#ifndef PROVMARK_RECORD_STORE_HPP
#define PROVMARK_RECORD_STORE_HPP

#include "record.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ProvMark {

    /**
     * @brief Persistence contract for provenance records.
     *
     * Implementations must make create and remove atomic: a record is either
     * fully visible or not at all. Records are never updated in place.
     */
    class RecordStore {
    public:
        virtual ~RecordStore() = default;

        /**
         * @brief Stores a new record. Assigns an id (and created_at) when empty.
         * @return The id of the stored record.
         * @throws ProvMark::MalformedInput if signed_at is not ISO-8601.
         * @throws ProvMark::LogicError if a record with the same id exists.
         */
        virtual std::string create(ProvenanceRecord record) = 0;

        // Exact matches, earliest signed_at first.
        virtual std::vector<ProvenanceRecord> find_by_content_hash(const std::string& content_hash) const = 0;

        // Every record that carries a perceptual hash.
        virtual std::vector<ProvenanceRecord> find_all_with_perceptual_hash() const = 0;

        virtual std::optional<ProvenanceRecord> find_by_id(const std::string& id) const = 0;

        /**
         * @return false if no record had this id.
         */
        virtual bool remove(const std::string& id) = 0;

        // Most recently signed first.
        virtual std::vector<ProvenanceRecord> list_recent(size_t limit) const = 0;

        virtual size_t count() const = 0;
    };

    /**
     * @brief Thread-safe RecordStore held in memory.
     */
    class InMemoryRecordStore : public RecordStore {
    public:
        InMemoryRecordStore() = default;

        std::string create(ProvenanceRecord record) override;
        std::vector<ProvenanceRecord> find_by_content_hash(const std::string& content_hash) const override;
        std::vector<ProvenanceRecord> find_all_with_perceptual_hash() const override;
        std::optional<ProvenanceRecord> find_by_id(const std::string& id) const override;
        bool remove(const std::string& id) override;
        std::vector<ProvenanceRecord> list_recent(size_t limit) const override;
        size_t count() const override;

    protected:
        struct Entry {
            ProvenanceRecord record;
            int64_t signed_at_millis = 0;
        };

        /**
         * @brief Called with the lock held after every mutation. If it throws,
         *        the mutation is rolled back and the exception propagates.
         */
        virtual void persist_locked() {}

        // For subclasses that load existing data. Caller holds the lock.
        // Returns false (and keeps the existing entry) if the id is taken.
        bool insert_locked(ProvenanceRecord record);

        mutable std::mutex mutex_;
        std::map<std::string, Entry> records_;
    };

    /**
     * @brief InMemoryRecordStore mirrored to a JSON file.
     *
     * The whole set is rewritten to "<path>.tmp" and renamed over the
     * target after each create or remove.
     */
    class JsonFileRecordStore : public InMemoryRecordStore {
    public:
        /**
         * @brief Loads existing records if the file exists.
         * @throws ProvMark::StoreError if the file cannot be read or parsed.
         */
        explicit JsonFileRecordStore(std::string path);

        const std::string& path() const { return path_; }

    protected:
        void persist_locked() override;

    private:
        void load();

        std::string path_;
    };

} // namespace ProvMark

#endif // PROVMARK_RECORD_STORE_HPP
