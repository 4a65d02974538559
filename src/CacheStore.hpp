#ifndef CACHESTORE_HPP
#define CACHESTORE_HPP

#include <string>
#include <optional>
#include <filesystem>

#include "Logger.hpp"
#include "CacheEntry.hpp"

// On-disk response cache: one file per key under a base directory, named by
// the hex key. Entries never expire; clear() is the only way to drop them.
//
// put() writes a temporary file beside the target and renames it into place,
// so a concurrent get() sees either no entry or a complete one. Two misses on
// the same key both write and the last rename wins; there is no per-key lock.
class CacheStore {
    public:
        explicit CacheStore(const std::string & base_dir);

        // lowercase hex SHA-256 of method, then host + target
        static std::string computeKey(const std::string & method,
                                      const std::string & host,
                                      const std::string & target);

        bool contains(const std::string & key) const;

        // nullopt when nothing is stored for key, throws StoreError on a bad record
        std::optional<CacheEntry> get(const std::string & key) const;

        // throws StoreError if the record cannot be persisted
        void put(const std::string & key, const CacheEntry & entry);

        // remove every entry, returns how many files were removed
        size_t clear();

        const std::filesystem::path & getBaseDir() const { return base_dir; }

        // record codec, see encode() for the layout
        static std::string encode(const CacheEntry & entry);
        static CacheEntry decode(const std::string & record);

    private:
        std::filesystem::path pathFor(const std::string & key) const;

        std::filesystem::path base_dir;
        static inline Logger & logger = Logger::getInstance();
};

#endif
