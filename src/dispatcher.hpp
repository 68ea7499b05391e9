#pragma once
#include "hooks.hpp"
#include "frame_writer.hpp"
#include <string>
#include <istream>

namespace notehook {

// Empty, unparsable, or non-object input is treated as {}
HookContext parse_context(const std::string& input);

// Resolves `hook_name`, reads the context from `in`, runs the hook and writes
// its frames. Returns the process exit code: 1 for an unknown hook (stdin is
// left unread), 0 otherwise, including when the hook itself failed.
int dispatch(const HookRegistry& hooks, FrameWriter& out,
             const std::string& hook_name, std::istream& in);

} // namespace notehook
