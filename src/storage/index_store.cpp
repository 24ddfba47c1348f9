#include "storage/index_store.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

namespace sentindex::storage {

bool InMemoryIndexStore::append(const IndexResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& rows = series_[result.index_name];
    auto pos = std::upper_bound(rows.begin(), rows.end(), result.timestamp,
        [](const WallTime& t, const IndexResult& row) { return t < row.timestamp; });

    // Primary key (time, index_name)
    if (pos != rows.begin() && std::prev(pos)->timestamp == result.timestamp) {
        spdlog::warn("Duplicate row for {} at same timestamp, not stored", result.index_name);
        return false;
    }

    rows.insert(pos, result);
    return true;
}

std::optional<IndexResult> InMemoryIndexStore::latest(const std::string& index_name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = series_.find(index_name);
    if (it == series_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::vector<IndexResult> InMemoryIndexStore::history(const std::string& index_name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = series_.find(index_name);
    if (it == series_.end()) {
        return {};
    }
    return it->second;
}

std::optional<PriorPeriod> prior_period_from(const IndexStore& store, const std::string& index_name) {
    auto last = store.latest(index_name);
    if (!last) {
        return std::nullopt;
    }
    return PriorPeriod{last->value, last->provenance.prices};
}

}  // namespace sentindex::storage
