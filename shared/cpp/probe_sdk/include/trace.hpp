#pragma once
#include <iostream>
#include <string>

// Debug trace channel. Lines go to stderr so stdout stays the plugin output.
class Trace {
public:
    Trace(std::string tag, bool enabled, std::ostream& out = std::cerr);

    bool enabled() const { return enabled_; }
    void line(const std::string& msg) const;

private:
    std::string tag_;
    bool enabled_{false};
    std::ostream& out_;
};
