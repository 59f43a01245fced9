#include "leaguesched/core/util/LogSink.h"

#include <iostream>

namespace leaguesched::core::util {

void EmitLog(const LogFn& log_fn, const std::string& line) {
    if (log_fn) {
        log_fn(line);
        return;
    }
    std::cerr << line << '\n';
}

}  // namespace leaguesched::core::util
