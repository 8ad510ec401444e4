#include "gatekv/kv_store.hpp"
#include <mutex>

namespace gatekv {

void KvStore::set(const std::string& key, const std::string& value) {
    std::unique_lock lock(mutex_);
    data_.insert_or_assign(key, value);
}

std::optional<std::string> KvStore::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end())
        return std::nullopt;
    return it->second;
}

bool KvStore::del(const std::string& key) {
    std::unique_lock lock(mutex_);
    return data_.erase(key) > 0;
}

bool KvStore::exists(const std::string& key) const {
    std::shared_lock lock(mutex_);
    return data_.contains(key);
}

size_t KvStore::size() const {
    std::shared_lock lock(mutex_);
    return data_.size();
}

} // namespace gatekv
