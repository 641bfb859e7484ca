#include "shell/Parser.hpp"

#include <stdexcept>

namespace osync::shell {

namespace {

struct FlagToken {
    std::string key;
    std::optional<std::string> inlineValue;
};

bool looksLikeFlag(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-' && arg != "--";
}

FlagToken splitFlag(const std::string& arg, const ParserSpec& spec) {
    FlagToken t;
    const bool isLong = arg.rfind("--", 0) == 0;
    auto body = arg.substr(isLong ? 2 : 1);

    if (const auto eq = body.find('='); eq != std::string::npos) {
        t.inlineValue = body.substr(eq + 1);
        body = body.substr(0, eq);
    }

    if (!isLong)
        if (const auto it = spec.shortFlags.find(body); it != spec.shortFlags.end()) body = it->second;

    t.key = std::move(body);
    return t;
}

}

void setOpt(std::vector<FlagKV>& opts, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : opts) if (k == key) { v = val; return; }
    opts.push_back(FlagKV{key, val});
}

CommandCall parseArgs(const std::vector<std::string>& args, const ParserSpec& spec) {
    CommandCall call;
    bool stop_flags = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (!stop_flags && arg == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && looksLikeFlag(arg)) {
            auto [key, value] = splitFlag(arg, spec);
            if (!value && spec.valueFlags.contains(key)) {
                if (i + 1 >= args.size()) throw std::invalid_argument("Option '" + arg + "' requires a value");
                value = args[++i];
            }
            const bool global = call.name.empty() || spec.globalFlags.contains(key);
            setOpt(global ? call.globals : call.options, key, value);
            continue;
        }

        // First word is the command; the rest are positionals
        if (call.name.empty()) call.name = arg;
        else call.positionals.push_back(arg);
    }

    return call;
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v;
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return true;
    return false;
}

bool hasGlobal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.globals) if (k == key) return true;
    return false;
}

std::optional<std::string> globalVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.globals) if (k == key) return v;
    return std::nullopt;
}

}
