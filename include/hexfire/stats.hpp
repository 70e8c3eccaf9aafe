#pragma once

#include "hexfire/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace hexfire {

    struct StatsEntry {
        std::optional<std::string> time_start;
        std::optional<std::string> time_end;
        std::optional<double> time_start_ts;
        std::optional<double> time_end_ts;
    };

    // Per-entity start/end overrides, read once before streaming and read-only afterwards.
    class StatsOverlay {
      private:
        std::unordered_map<std::string, StatsEntry> entries_;

      public:
        StatsOverlay() = default;

        // Never throws: a missing or malformed table logs a warning and yields an empty overlay.
        static StatsOverlay load(const std::filesystem::path &path);

        void insert(const std::string &entity_id, StatsEntry entry) { entries_[entity_id] = std::move(entry); }

        const StatsEntry *find(const std::string &entity_id) const {
            auto it = entries_.find(entity_id);
            return it == entries_.end() ? nullptr : &it->second;
        }

        std::size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

        // Fills time_min/time_max(_ts) from the entity's entry, field by field, only where the
        // feature left them unset. Returns the properties unchanged when no entry applies.
        FireProperties apply(FireProperties props) const;
    };

} // namespace hexfire
