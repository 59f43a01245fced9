#pragma once

#include <functional>
#include <string>

namespace leaguesched::core::util {

using LogFn = std::function<void(const std::string&)>;

// Forwards to log_fn when set, otherwise writes the line to std::cerr.
void EmitLog(const LogFn& log_fn, const std::string& line);

}  // namespace leaguesched::core::util
