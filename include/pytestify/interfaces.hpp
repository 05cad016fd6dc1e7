#pragma once

#include "pytestify/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pytestify {

// Result of handing a file's text to the external assertion converter
struct AssertionConversion {
    std::string text;
    bool success = false;
    std::string message;
};

// Result of running the test suite of one migrated file
struct TestRunOutcome {
    bool success = false;
    std::string message;
};

struct TrackingEntry {
    std::string file;
    bool success = false;
    std::string message;

    auto operator==(const TrackingEntry& other) const -> bool = default;
};

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto write_file_atomic(const std::string& path, const std::string& content) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
    virtual auto is_directory(const std::string& path) -> bool = 0;
    virtual auto list_files(const std::string& directory) -> std::vector<std::string> = 0;
    virtual auto create_backup(const std::string& path, const std::string& backup_dir)
        -> std::optional<std::string> = 0;
};

class IAssertionConverter {
public:
    virtual ~IAssertionConverter() = default;
    virtual auto name() const -> std::string = 0;
    virtual auto is_available() -> bool = 0;
    virtual auto convert(const std::string& text) -> AssertionConversion = 0;
};

class ITestRunner {
public:
    virtual ~ITestRunner() = default;
    virtual auto name() const -> std::string = 0;
    virtual auto is_available() -> bool = 0;
    virtual auto run(const std::string& path) -> TestRunOutcome = 0;
};

class ITrackingStore {
public:
    virtual ~ITrackingStore() = default;
    virtual auto record(const std::string& file, bool success, const std::string& message)
        -> bool = 0;
    virtual auto read_status(const std::string& file) -> std::optional<TrackingEntry> = 0;
};

class IReviewTerminal {
public:
    virtual ~IReviewTerminal() = default;
    virtual auto is_interactive() -> bool = 0;
    virtual auto review(const FileTransformResult& result, size_t index, size_t total)
        -> ReviewDecision = 0;
};

} // namespace pytestify
