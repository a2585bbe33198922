#pragma once

#include <string>

namespace glacier::scripting {

// A script to run, as loaded from disk or embedded by a test.
struct ScriptSource {
    std::string name;       // chunk name shown in error messages
    std::string content;
    
    bool empty() const { return content.empty(); }
};

} // namespace glacier::scripting
