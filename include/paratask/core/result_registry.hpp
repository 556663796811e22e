// ============================================================================
// paratask/core/result_registry.hpp - Per-Task Outcome Store
// ============================================================================
//
// ResultRegistry<R> maps TaskId -> (task name, Outcome<R>). Each task's
// pipeline writes its own entry at most once, from whichever pool worker runs
// its evaluation stage; any thread may read concurrently. Entries are keyed
// by the generated TaskId, never by name: two tasks may share a name.
//
// Results<R> is an immutable snapshot handed back by
// TaskGroup::WaitForResults(). It answers the name-based and cardinality
// questions callers ask after the race is over.
//
// USAGE:
// ------
//   auto results = group.WaitForResults().Value();
//   if (results.HasMoreThanOneResult()) {
//       for (const auto& name : results.GetTasks()) { ... }
//   }
//   auto single = results.GetSingleResult();
//
// ============================================================================

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "paratask/core/error.hpp"
#include "paratask/core/outcome.hpp"
#include "paratask/core/result.hpp"
#include "paratask/core/task_state.hpp"

namespace paratask {

template <typename R>
struct ResultEntry {
    TaskId id;
    std::string name;
    Outcome<R> outcome;
};

// ============================================================================
// Results<R> - Snapshot of the registry
// ============================================================================
template <typename R>
class Results {
   public:
    Results() = default;

    // Entries in ascending TaskId order, which is registration order
    explicit Results(std::vector<ResultEntry<R>> entries) : entries_(std::move(entries)) {}

    bool IsEmpty() const noexcept { return entries_.empty(); }

    size_t Size() const noexcept { return entries_.size(); }

    size_t SuccessCount() const noexcept {
        size_t count = 0;
        for (const auto& entry : entries_) {
            if (entry.outcome.IsSuccessful()) ++count;
        }
        return count;
    }

    bool HasMoreThanOneResult() const noexcept { return SuccessCount() > 1; }

    // Name -> outcome. When names repeat, the earliest registered task wins.
    std::map<std::string, Outcome<R>> GetResults() const {
        std::map<std::string, Outcome<R>> results;
        for (const auto& entry : entries_) {
            results.emplace(entry.name, entry.outcome);
        }
        return results;
    }

    // Names of the evaluated tasks, in registration order
    std::vector<std::string> GetTasks() const {
        std::vector<std::string> names;
        names.reserve(entries_.size());
        for (const auto& entry : entries_) {
            names.push_back(entry.name);
        }
        return names;
    }

    std::optional<Outcome<R>> ResultFor(TaskId id) const {
        for (const auto& entry : entries_) {
            if (entry.id == id) return entry.outcome;
        }
        return std::nullopt;
    }

    // First task registered under this name
    std::optional<Outcome<R>> Find(const std::string& name) const {
        for (const auto& entry : entries_) {
            if (entry.name == name) return entry.outcome;
        }
        return std::nullopt;
    }

    // The one successful outcome; NoResult or AmbiguousResult otherwise
    Result<Outcome<R>, Error> GetSingleResult() const {
        const ResultEntry<R>* found = nullptr;
        for (const auto& entry : entries_) {
            if (!entry.outcome.IsSuccessful()) continue;
            if (found != nullptr) {
                return Err(make_error_code(Errc::AmbiguousResult));
            }
            found = &entry;
        }
        if (found == nullptr) {
            return Err(make_error_code(Errc::NoResult));
        }
        return Ok(found->outcome);
    }

    const std::vector<ResultEntry<R>>& Entries() const noexcept { return entries_; }

   private:
    std::vector<ResultEntry<R>> entries_;
};

// ============================================================================
// ResultRegistry<R> - Concurrent writer/reader store
// ============================================================================
template <typename R>
class ResultRegistry {
   public:
    ResultRegistry() = default;

    ResultRegistry(const ResultRegistry&) = delete;
    ResultRegistry& operator=(const ResultRegistry&) = delete;

    // Returns false, leaving the first entry in place, if the task already
    // has one.
    bool Record(TaskId id, std::string name, Outcome<R> outcome) {
        std::unique_lock lock(mutex_);
        return entries_.try_emplace(id, Entry{std::move(name), std::move(outcome)}).second;
    }

    std::optional<Outcome<R>> ResultFor(TaskId id) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second.outcome;
    }

    bool Contains(TaskId id) const {
        std::shared_lock lock(mutex_);
        return entries_.count(id) != 0;
    }

    size_t Size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    bool IsEmpty() const { return Size() == 0; }

    Results<R> Snapshot() const {
        std::vector<ResultEntry<R>> entries;
        std::shared_lock lock(mutex_);
        entries.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            entries.push_back(ResultEntry<R>{id, entry.name, entry.outcome});
        }
        return Results<R>(std::move(entries));
    }

   private:
    struct Entry {
        std::string name;
        Outcome<R> outcome;
    };

    mutable std::shared_mutex mutex_;
    std::map<TaskId, Entry> entries_;
};

}  // namespace paratask
