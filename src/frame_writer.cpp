#include "frame_writer.hpp"

namespace notehook {

void FrameWriter::log(const std::string& msg) {
    write_line({{"log", msg}});
}

void FrameWriter::emit(const std::string& key, const nlohmann::json& value) {
    nlohmann::json frame = nlohmann::json::object();
    frame[key] = value;
    write_line(frame);
}

void FrameWriter::emit_result(const nlohmann::json& result) {
    for (auto& [key, value] : result.items()) {
        emit(key, value);
    }
}

void FrameWriter::write_line(const nlohmann::json& frame) {
    // Note bodies are arbitrary text; invalid UTF-8 is replaced, not fatal.
    out_ << frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_.flush();
    ++frames_;
}

} // namespace notehook
