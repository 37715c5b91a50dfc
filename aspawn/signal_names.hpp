#pragma once

#include <optional>
#include <string>

namespace aspawn {

// "SIGKILL" for SIGKILL. Unknown numbers render as "SIG<n>".
std::string signal_name(int signo);

std::optional<int> signal_number(const std::string& name);

// "ENOENT" for ENOENT. Unknown numbers render as "E<n>".
std::string errno_code(int error_number);

} // namespace aspawn
