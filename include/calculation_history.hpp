#pragma once

#include "calculator_engine.hpp"
#include <deque>
#include <string>
#include <vector>

namespace calculator {

constexpr size_t kMaxHistoryEntries = 10;

// Most recent completed calculations, oldest first. Persisted as a signed
// JSON document (history/<name>.tcalc).
class HistoryLog {
public:
    explicit HistoryLog(std::string name = "default");

    void add(const std::string& entry);
    void add(const Calculation& calc) { add(calc.to_string()); }
    void clear();

    const std::deque<std::string>& entries() const { return entries_; }
    // Up to `count` newest entries, oldest first
    std::vector<std::string> recent(size_t count) const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::string& name() const { return name_; }
    void set_name(const std::string& name) { name_ = name; }

    // JSON text without a signature
    std::string to_json() const;
    // Replace the contents from JSON text; false on malformed input
    bool from_json(const std::string& json_str);

    // Signed, atomic save. Empty argument uses the log's name.
    bool save(const std::string& base_filename = "");
    // Load and verify the signature; contents are untouched on failure
    bool load(const std::string& base_filename = "");

    // Resolve "name" -> "history/name.tcalc"; paths with a '/' are kept
    static std::string resolve_path(const std::string& base_filename);

    const std::string& get_error() const { return last_error_; }

private:
    std::string name_;
    std::deque<std::string> entries_;
    std::string last_error_;
};

} // namespace calculator
