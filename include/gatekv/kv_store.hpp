#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <shared_mutex>


namespace gatekv {

/*
 * Thread-safe in-memory key-value store shared by every connection.
 *
 * Writers (set, del) hold the lock exclusively, readers share it, so a
 * reader never observes a half-applied write. Concurrent writes to the same
 * key resolve in lock-acquisition order.
 */
class KvStore {
public:
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    // Returns true if a key was removed. Removing a missing key is not an error.
    bool del(const std::string& key);

    bool exists(const std::string& key) const;
    size_t size() const;

private:
    std::unordered_map<std::string, std::string> data_;
    mutable std::shared_mutex mutex_;
};

} // namespace gatekv
