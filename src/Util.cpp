#include <agen/util/Assert.hpp>
#include <agen/util/Trace.hpp>
#include <fmt/core.h>
#include <cstdio>

namespace agen {

[[noreturn]] void _assertionFail(std::string_view what, std::string_view why, std::string_view file, int line) {
    throw AssertionFailure(fmt::format("Assertion failed ({}) at {}:{}: {}", what, file, line, why));
}

static std23::move_only_function<void(std::string, LogLevel)> g_logFunction;

void doLogMessage(std::string message, LogLevel level) {
    if (g_logFunction) {
        g_logFunction(std::move(message), level);
    } else {
        switch (level) {
            case LogLevel::Trace: {
                fmt::print("{}\n", message);
            } break;

            case LogLevel::Warn: {
                fmt::print(stderr, "{}\n", message);
            } break;

            case LogLevel::Error: {
                fmt::print(stderr, "{}\n", message);
            } break;
        }
    }
}

void setLogFunction(std23::move_only_function<void(std::string, LogLevel)> func) {
    g_logFunction = std::move(func);
}

}
