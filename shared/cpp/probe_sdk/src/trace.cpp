#include "../include/trace.hpp"
#include <utility>

Trace::Trace(std::string tag, bool enabled, std::ostream& out)
    : tag_(std::move(tag)), enabled_(enabled), out_(out) {}

void Trace::line(const std::string& msg) const {
    if (!enabled_) return;
    out_ << "[" << tag_ << "] " << msg << std::endl;
}
