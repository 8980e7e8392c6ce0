#pragma once

#include <map>
#include <string>
#include <vector>

namespace mcprouter {
namespace service {

// Launch parameters for one worker service. Immutable once loaded.
struct ServiceDefinition {
    std::string id;                          // e.g., "github"
    std::string command;                     // Executable name or path (PATH lookup applies)
    std::vector<std::string> args;           // Command-line arguments
    std::string cwd;                         // Working directory (empty = inherit)
    std::map<std::string, std::string> env;  // Overrides merged over process-wide defaults
    int startup_timeout_ms = 10000;          // Spawn + initialize handshake budget
};

}  // namespace service
}  // namespace mcprouter
