#include "config/paths.hpp"

#include <cctype>
#include <cstdlib>

namespace osync::paths {

namespace {

std::optional<std::string> env(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (const char* v = std::getenv(name.c_str())) return std::string(v);
    return std::nullopt;
}

bool isVarChar(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string expandPercentVars(const std::string& in) {
    std::string out;
    out.reserve(in.size());

    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%') {
            const auto close = in.find('%', i + 1);
            if (close != std::string::npos && close > i + 1) {
                const auto name = in.substr(i + 1, close - i - 1);
                if (const auto value = env(name)) {
                    out += *value;
                    i = close;
                    continue;
                }
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

std::string expandDollarVars(const std::string& in) {
    std::string out;
    out.reserve(in.size());

    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '$' || i + 1 >= in.size()) {
            out.push_back(in[i]);
            continue;
        }

        if (in[i + 1] == '{') {
            const auto close = in.find('}', i + 2);
            if (close == std::string::npos) {
                out.push_back(in[i]);
                continue;
            }
            const auto name = in.substr(i + 2, close - i - 2);
            if (const auto value = env(name)) out += *value;
            else out += in.substr(i, close - i + 1);
            i = close;
            continue;
        }

        size_t end = i + 1;
        while (end < in.size() && isVarChar(in[end])) ++end;
        if (end == i + 1) {
            out.push_back(in[i]);
            continue;
        }
        const auto name = in.substr(i + 1, end - i - 1);
        if (const auto value = env(name)) out += *value;
        else out += in.substr(i, end - i);
        i = end - 1;
    }
    return out;
}

std::string expandHome(const std::string& in) {
    if (in.empty() || in[0] != '~') return in;
    if (in.size() > 1 && in[1] != '/' && in[1] != '\\') return in;  // ~user is not supported

    auto home = env("HOME");
    if (!home) home = env("USERPROFILE");
    if (!home) return in;
    return *home + in.substr(1);
}

}

fs::path resolveRepoRoot(const std::optional<std::string>& override) {
    fs::path root;
    if (override && !override->empty()) root = *override;
    else if (const auto fromEnv = env(REPO_ENV_VAR); fromEnv && !fromEnv->empty()) root = *fromEnv;
    else root = fs::current_path();

    return fs::weakly_canonical(fs::absolute(root));
}

std::string defaultOrcaDir() {
#if defined(__APPLE__)
    return "~/Library/Application Support/OrcaSlicer";
#elif defined(_WIN32)
    return "%APPDATA%\\OrcaSlicer";
#else
    return "~/.config/OrcaSlicer";
#endif
}

fs::path expandPath(const std::string& raw, const fs::path& base) {
    const auto expanded = expandDollarVars(expandHome(expandPercentVars(raw)));

    fs::path p(expanded);
    if (!p.is_absolute()) p = base / p;
    return fs::weakly_canonical(p);
}

}
