#pragma once

#include <string>

namespace keepsake {

// Run-wide configuration. Only the outermost harness or CLI reads it from
// the environment; the engine receives the values as plain parameters.
struct RunSettings {
    // KEEPSAKE_UPDATE: no|0 (default) or always|1|yes.
    bool updateMode = false;
    // KEEPSAKE_TRACE=1
    bool traceEnabled = false;
    // KEEPSAKE_WORKSPACE, defaults to the current directory.
    std::string workspaceRoot;

    static RunSettings fromEnvironment();
};

// Interprets a KEEPSAKE_UPDATE value; unknown values are treated as off.
bool parseUpdateMode(const std::string &value, bool *recognized = nullptr);

} // namespace keepsake
