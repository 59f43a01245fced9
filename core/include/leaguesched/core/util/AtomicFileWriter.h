#pragma once

#include <string>

namespace leaguesched::core::util {

class AtomicFileWriter {
public:
    // Writes contents to path.tmp and renames it over path. Creates missing
    // parent directories.
    static bool Write(const std::string& path, const std::string& contents, std::string* error = nullptr);
};

}  // namespace leaguesched::core::util
