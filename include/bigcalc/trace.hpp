#pragma once
#include <cstdio>
#include <utility>

#include <fmt/core.h>

namespace bigcalc {

// Diagnostic sink for the pipeline. Disabled unless given a stream.
class Trace {
public:
    Trace() = default;
    explicit Trace(std::FILE* sink) : sink_(sink) {}

    bool enabled() const { return sink_ != nullptr; }

    template <class... Args>
    void operator()(fmt::format_string<Args...> format, Args&&... args) const {
        if (!sink_) return;
        fmt::print(sink_, "[trace] {}\n", fmt::format(format, std::forward<Args>(args)...));
    }

private:
    std::FILE* sink_{nullptr};
};

} // namespace bigcalc
