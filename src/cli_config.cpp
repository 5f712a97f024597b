#include "passgen/cli_config.hpp"

#include <stdexcept>
#include <string_view>
#include <utility>

#include "passgen/gen_status.hpp"
#include "passgen/presets.hpp"

namespace passgen {

namespace {

// Double-quoted with control characters escaped, e.g. "a\tb" for a tab.
std::string Quoted(const std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (const char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\0':
                out += "\\0";
                break;
            default:
                if (byte < 0x20U || byte == 0x7FU) {
                    static constexpr char kHex[] = "0123456789abcdef";
                    out += "\\u{";
                    if (byte >= 0x10U) {
                        out.push_back(kHex[byte >> 4U]);
                    }
                    out.push_back(kHex[byte & 0x0FU]);
                    out.push_back('}');
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
    return out;
}

void ApplyPreset(const Preset& preset, GenConfig& config) {
    config.token_count = preset.token_count;
    config.token_separator = std::string(preset.separator);
    config.token_pool = preset.Pool();
}

bool ParsePositiveCount(const std::string& value, std::size_t& out) {
    if (value.empty() || value.front() == '-' || value.front() == '+') {
        return false;
    }
    std::size_t idx = 0;
    try {
        const unsigned long long parsed = std::stoull(value, &idx);
        if (idx != value.size() ||
            parsed == 0 ||
            parsed > static_cast<unsigned long long>(kMaxTokenCount)) {
            return false;
        }
        out = static_cast<std::size_t>(parsed);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

}  // namespace

GenConfig::GenConfig() {
    ApplyPreset(DefaultPreset(), *this);
}

bool ParseArgs(const int argc, const char* const argv[], GenConfig& out_config, std::string& error) {
    GenConfig config;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "missing argument to " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (arg == "-r" || arg == "--report") {
            config.report = true;
        } else if (arg == "-l" || arg == "--log") {
            config.log = true;
        } else if (arg == "-h" || arg == "--help") {
            config.help = true;
        } else if (arg == "-c" || arg == "--count") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            if (!ParsePositiveCount(value, config.token_count)) {
                error = "invalid argument to " + Quoted(arg) + ", expected positive number got " + Quoted(value);
                return false;
            }
        } else if (arg == "-s" || arg == "--sep") {
            if (!require_value(config.token_separator)) {
                return false;
            }
        } else if (arg == "-f" || arg == "--file") {
            std::string path;
            if (!require_value(path)) {
                return false;
            }
            const GenStatus status = LoadTokenFile(path, config.token_pool);
            if (status != GenStatus::Ok) {
                error = "error while reading token file " + Quoted(path) + ": " + std::string(ToString(status));
                return false;
            }
        } else if (arg == "-p" || arg == "--preset") {
            std::string name;
            if (!require_value(name)) {
                return false;
            }
            const Preset* preset = FindPreset(name);
            if (preset == nullptr) {
                error = "invalid preset " + Quoted(name);
                return false;
            }
            ApplyPreset(*preset, config);
        } else {
            error = "invalid option " + Quoted(arg);
            return false;
        }
    }

    out_config = std::move(config);
    return true;
}

}  // namespace passgen
