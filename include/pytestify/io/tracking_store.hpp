#pragma once

#include "pytestify/interfaces.hpp"
#include <map>
#include <string>

namespace pytestify {

// File-backed tracking store, one "path|ok|message" line per file
// ("ok" or "failed"). The whole file is rewritten after every record.
class FileTrackingStore : public ITrackingStore {
public:
    explicit FileTrackingStore(std::string store_path);

    auto record(const std::string& file, bool success, const std::string& message)
        -> bool override;
    auto read_status(const std::string& file) -> std::optional<TrackingEntry> override;

    auto entries() const -> const std::map<std::string, TrackingEntry>&
    {
        return entries_;
    }

private:
    auto save() const -> bool;

    std::string store_path_;
    std::map<std::string, TrackingEntry> entries_;
};

auto format_tracking_entry(const TrackingEntry& entry) -> std::string;
auto parse_tracking_entry(const std::string& line) -> std::optional<TrackingEntry>;

} // namespace pytestify
