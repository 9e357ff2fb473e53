#pragma once

#include <mutex>
#include <string>

namespace rg
{
// Append-only NDJSON stream of switch/benchmark/leak events.
// An empty path disables the log; write failures only warn.
class EventLog
{
public:
    explicit EventLog(std::string path);

    // `json_object` must be a single-line JSON object.
    void append(const std::string &json_object);

    const std::string &path() const { return path_; }

private:
    std::string path_;
    std::mutex mtx_;
    bool warned_ = false;
};
} // namespace rg
