#pragma once

#include "index/index_result.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sentindex::storage {

/// Append-only time-series of computed index values, keyed by (time, index_name)
class IndexStore {
public:
    virtual ~IndexStore() = default;

    /// Append a computed result
    /// @return false if a row with the same (time, index_name) already exists
    virtual bool append(const IndexResult& result) = 0;

    /// Most recent result for an index
    [[nodiscard]] virtual std::optional<IndexResult> latest(const std::string& index_name) const = 0;

    /// Results for an index, oldest first
    [[nodiscard]] virtual std::vector<IndexResult> history(const std::string& index_name) const = 0;
};

/// Process-local store, used by the CLI and tests
class InMemoryIndexStore final : public IndexStore {
public:
    bool append(const IndexResult& result) override;

    [[nodiscard]] std::optional<IndexResult> latest(const std::string& index_name) const override;

    [[nodiscard]] std::vector<IndexResult> history(const std::string& index_name) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<IndexResult>> series_;
};

/// Previous period for the return-based method, built from the latest stored result
[[nodiscard]] std::optional<PriorPeriod> prior_period_from(const IndexStore& store,
                                                          const std::string& index_name);

}  // namespace sentindex::storage
