#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace cairn::core {

// Environment lookup used for CAIRN_* overrides. nullopt when unset; an empty
// string when set to "". _dupenv_s on Windows (MSVC flags std::getenv there).
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// True when the variable is set, non-empty and does not start with '0'.
inline bool env_flag(const char* name) noexcept {
    auto v = safe_getenv(name);
    return v && !v->empty() && (*v)[0] != '0';
}

// Diagnostic logging switch (CAIRN_DEBUG). Evaluated on every call so tests can toggle it.
inline bool debug_enabled() noexcept {
    return env_flag("CAIRN_DEBUG");
}

} // namespace cairn::core
