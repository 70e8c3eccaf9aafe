#include "hexfire/stats.hpp"

#include "hexfire/log.hpp"
#include "hexfire/parser.hpp"
#include "hexfire/timestamp.hpp"

#include <boost/json.hpp>
#include <exception>

namespace hexfire {

    StatsOverlay StatsOverlay::load(const std::filesystem::path &path) {
        StatsOverlay overlay;

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            log()->warn("stats table {} not found, continuing without overrides", path.string());
            return overlay;
        }

        boost::json::value doc;
        try {
            doc = op::ReadDocument(path);
        } catch (const std::exception &e) {
            log()->warn("failed to read stats file {}: {}", path.string(), e.what());
            return overlay;
        }

        auto const *features = doc.as_object().if_contains("features");
        if (!features || !features->is_array()) {
            log()->warn("stats file {} has no feature array", path.string());
            return overlay;
        }

        for (auto const &feat : features->as_array()) {
            auto const *obj = feat.if_object();
            if (!obj)
                continue;
            auto const *props_v = obj->if_contains("properties");
            auto const *props = props_v ? props_v->if_object() : nullptr;
            if (!props)
                continue;

            std::optional<std::string> id;
            if (auto const *v = props->if_contains("fire_event_id"))
                id = scalarText(*v);
            if (!id) {
                if (auto const *v = props->if_contains("id_fire_event"))
                    id = scalarText(*v);
            }
            if (!id)
                continue;

            StatsEntry entry;
            if (auto const *v = props->if_contains("time_start"); v && v->is_string()) {
                entry.time_start = std::string(v->as_string());
                entry.time_start_ts = ParseTimestamp(entry.time_start);
            }
            if (auto const *v = props->if_contains("time_end"); v && v->is_string()) {
                entry.time_end = std::string(v->as_string());
                entry.time_end_ts = ParseTimestamp(entry.time_end);
            }
            overlay.insert(*id, std::move(entry));
        }

        log()->debug("loaded {} stats entries from {}", overlay.size(), path.string());
        return overlay;
    }

    FireProperties StatsOverlay::apply(FireProperties props) const {
        if (!props.id_fire_event)
            return props;
        auto const *entry = find(*props.id_fire_event);
        if (!entry)
            return props;

        if (!props.time_min_ts && entry->time_start_ts)
            props.time_min_ts = entry->time_start_ts;
        if (!props.time_max_ts && entry->time_end_ts)
            props.time_max_ts = entry->time_end_ts;
        if (!props.time_min && entry->time_start && !entry->time_start->empty())
            props.time_min = entry->time_start;
        if (!props.time_max && entry->time_end && !entry->time_end->empty())
            props.time_max = entry->time_end;
        return props;
    }

} // namespace hexfire
