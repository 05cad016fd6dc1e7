#include "pytestify/io/tracking_store.hpp"
#include <fstream>

namespace pytestify {

namespace {

// '|' separates fields and each entry is one line
auto sanitize(std::string text) -> std::string {
    for (auto& ch : text) {
        if (ch == '|' || ch == '\n' || ch == '\r') {
            ch = ' ';
        }
    }
    return text;
}

} // namespace

auto format_tracking_entry(const TrackingEntry& entry) -> std::string {
    return sanitize(entry.file) + "|" + (entry.success ? "ok" : "failed") + "|" +
           sanitize(entry.message);
}

auto parse_tracking_entry(const std::string& line) -> std::optional<TrackingEntry> {
    // Parse: path|status|message (exactly two pipes)
    auto first = line.find('|');
    if (first == std::string::npos || first == 0) {
        return std::nullopt;
    }
    auto second = line.find('|', first + 1);
    if (second == std::string::npos || line.find('|', second + 1) != std::string::npos) {
        return std::nullopt;
    }

    auto status = line.substr(first + 1, second - first - 1);
    if (status != "ok" && status != "failed") {
        return std::nullopt;
    }
    return TrackingEntry{
        .file = line.substr(0, first),
        .success = status == "ok",
        .message = line.substr(second + 1),
    };
}

FileTrackingStore::FileTrackingStore(std::string store_path)
    : store_path_(std::move(store_path)) {
    std::ifstream file(store_path_);
    if (!file.is_open()) {
        return;  // Starts empty; the file is created on the first record
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        if (auto entry = parse_tracking_entry(line)) {
            entries_[entry->file] = *entry;
        }
    }
}

auto FileTrackingStore::record(const std::string& file, bool success, const std::string& message)
    -> bool {
    auto key = sanitize(file);
    entries_[key] = TrackingEntry{.file = key, .success = success, .message = sanitize(message)};
    return save();
}

auto FileTrackingStore::read_status(const std::string& file) -> std::optional<TrackingEntry> {
    auto it = entries_.find(sanitize(file));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto FileTrackingStore::save() const -> bool {
    std::ofstream file(store_path_, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    for (const auto& [path, entry] : entries_) {
        file << format_tracking_entry(entry) << "\n";
    }
    return file.good();
}

} // namespace pytestify
