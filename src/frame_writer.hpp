#pragma once
#include <string>
#include <ostream>
#include <nlohmann/json.hpp>

namespace notehook {

// Line-delimited JSON output. Diagnostics and results share one stream and
// are told apart by key alone: log frames are {"log": ...}, result frames
// carry exactly one result key each.
class FrameWriter {
public:
    explicit FrameWriter(std::ostream& out) : out_(out) {}

    // {"log": msg}
    void log(const std::string& msg);

    // {key: value}
    void emit(const std::string& key, const nlohmann::json& value);

    // One frame per top-level key of `result`
    void emit_result(const nlohmann::json& result);

    int frames_written() const { return frames_; }

private:
    std::ostream& out_;
    int frames_ = 0;

    void write_line(const nlohmann::json& frame);
};

} // namespace notehook
