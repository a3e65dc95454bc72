/*
 * stacktrace.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "stacktrace.hpp"

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <memory>
#include <sstream>

#if defined(__APPLE__) || defined(__linux__)
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#define RETRYPOOL_HAS_EXECINFO 1
#endif

namespace retrypool::error {

namespace {

constexpr int MAX_FRAMES = 64;
// capture() and the StackTrace constructor
constexpr int SKIPPED_FRAMES = 2;

auto formatAddress(uintptr_t address) -> std::string {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(sizeof(void *) * 2) << address;
    return oss.str();
}

auto getBaseName(const std::string &path) -> std::string {
    size_t lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        return path.substr(lastSlash + 1);
    }
    return path;
}

#ifdef RETRYPOOL_HAS_EXECINFO
auto demangle(const char *mangled) -> std::string {
    int status = 0;
    std::unique_ptr<char, decltype(&free)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return mangled;
}
#endif

}  // namespace

StackTrace::StackTrace() { capture(); }

void StackTrace::capture() {
#ifdef RETRYPOOL_HAS_EXECINFO
    void *raw[MAX_FRAMES];
    int count = backtrace(raw, MAX_FRAMES);
    for (int i = SKIPPED_FRAMES; i < count; ++i) {
        frames_.push_back(raw[i]);
    }
#endif
}

auto StackTrace::toString() const -> std::string {
    std::ostringstream oss;
    if (frames_.empty()) {
        oss << "\tStack trace not available on this platform.\n";
        return oss.str();
    }
    for (size_t i = 0; i < frames_.size(); ++i) {
        oss << "\t[" << i << "] "
            << processFrame(frames_[i], static_cast<int>(i)) << "\n";
    }
    return oss.str();
}

auto StackTrace::processFrame(void *frame, int frameIndex) const
    -> std::string {
    std::ostringstream oss;
    auto address = reinterpret_cast<uintptr_t>(frame);

#ifdef RETRYPOOL_HAS_EXECINFO
    Dl_info info{};
    if (dladdr(frame, &info) != 0) {
        std::string function = info.dli_sname != nullptr
                                   ? demangle(info.dli_sname)
                                   : "<unknown function>";
        std::string module = info.dli_fname != nullptr
                                 ? getBaseName(info.dli_fname)
                                 : "<unknown module>";
        auto offset =
            info.dli_saddr != nullptr
                ? address - reinterpret_cast<uintptr_t>(info.dli_saddr)
                : 0;
        oss << function << " +0x" << std::hex << offset << std::dec << " in "
            << module << " at " << formatAddress(address);
        return oss.str();
    }
#endif

    oss << "<frame " << frameIndex << "> at " << formatAddress(address);
    return oss.str();
}

}  // namespace retrypool::error
