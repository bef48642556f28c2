#pragma once
#include "sim_config.hpp"
#include <string>

namespace cubesim {

// ---------------------------------------------------------------------------
// ConfigLoader — reads a JSON config file into a SimConfig.
//
// Absent keys keep their SimConfig defaults. The result is validated before
// it is written to `out`; on any failure `out` is left untouched and the
// reason goes to `error` when one is supplied.
// No Raylib dependency — compilable in the headless test target.
// ---------------------------------------------------------------------------

class ConfigLoader {
public:
    // Returns false if the file cannot be opened, the JSON is malformed or the
    // resulting configuration fails validation.
    static bool load(const std::string& path, SimConfig& out, std::string* error = nullptr);

    // Same as load(), parsing from a string instead of a file.
    static bool load_from_string(const std::string& json, SimConfig& out,
                                 std::string* error = nullptr);
};

} // namespace cubesim
