#include <vksched/error.hpp>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace vksched {

#ifndef VKSCHED_ENABLE_EXCEPTIONS
#define VKSCHED_ENABLE_EXCEPTIONS 1
#endif

std::string Error::format() const {
    std::string out = "vksched: " + operation + " failed";

    if (vkResult != 0) {
        out += " (VkResult " + std::to_string(vkResult) + ")";
    }

    if (!message.empty()) {
        out += ": " + message;
    }

    return out;
}

void throwError(const Error& e) {
#if VKSCHED_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

void fatal(std::string_view operation, std::string message) {
    throwError(Error{std::string(operation), 0, std::move(message)});
}

} // namespace vksched
