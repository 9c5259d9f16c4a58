//! # Configuration Loading
//!
//! Line-oriented reader for the subset of TOML maplint needs: section
//! headers, `key = value` pairs, booleans, integers, strings, and string
//! arrays (which may span lines). Comments start with `#` outside strings.

#include "maplint/config/config.hpp"

#include "maplint/log/log.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <vector>

namespace maplint::config {

auto ConfigError::to_string() const -> std::string {
    std::string out = path;
    if (line > 0) {
        out += ":" + std::to_string(line);
    }
    return out + ": " + message;
}

namespace {

enum class ValueKind { Bool, Integer, String, Array, Invalid };

struct TomlValue {
    ValueKind kind = ValueKind::Invalid;
    bool boolean = false;
    int64_t integer = 0;
    std::string string;
    std::vector<std::string> array;
};

auto trim(std::string_view text) -> std::string_view {
    size_t start = text.find_first_not_of(" \t\r");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

/// Drops a trailing `# comment` that is not inside a string.
auto strip_comment(std::string_view line) -> std::string_view {
    bool in_string = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"' && (i == 0 || line[i - 1] != '\\')) {
            in_string = !in_string;
        } else if (c == '#' && !in_string) {
            return line.substr(0, i);
        }
    }
    return line;
}

auto unquote(std::string_view text) -> std::optional<std::string> {
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        return std::nullopt;
    }
    std::string out;
    for (size_t i = 1; i + 1 < text.size(); ++i) {
        if (text[i] == '\\' && i + 2 < text.size()) {
            ++i;
            switch (text[i]) {
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += text[i];
                break;
            }
        } else {
            out += text[i];
        }
    }
    return out;
}

auto parse_value(std::string_view raw) -> TomlValue {
    TomlValue value;
    auto text = trim(raw);
    if (text == "true" || text == "false") {
        value.kind = ValueKind::Bool;
        value.boolean = text == "true";
        return value;
    }
    if (!text.empty() && text.front() == '"') {
        if (auto s = unquote(text)) {
            value.kind = ValueKind::String;
            value.string = std::move(*s);
        }
        return value;
    }
    if (!text.empty() && text.front() == '[') {
        if (text.back() != ']') {
            return value;
        }
        auto inner = text.substr(1, text.size() - 2);
        value.kind = ValueKind::Array;
        size_t pos = 0;
        while (pos < inner.size()) {
            auto comma = inner.find(',', pos);
            auto item = trim(inner.substr(pos, comma == std::string_view::npos ? inner.size() - pos
                                                                              : comma - pos));
            if (!item.empty()) {
                auto s = unquote(item);
                if (!s) {
                    value.kind = ValueKind::Invalid;
                    return value;
                }
                value.array.push_back(std::move(*s));
            }
            if (comma == std::string_view::npos) {
                break;
            }
            pos = comma + 1;
        }
        return value;
    }

    int64_t number = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (ec == std::errc() && ptr == text.data() + text.size() && !text.empty()) {
        value.kind = ValueKind::Integer;
        value.integer = number;
    }
    return value;
}

class ConfigReader {
public:
    ConfigReader(Settings& settings, const std::string& origin)
        : settings_(settings), origin_(origin) {}

    void apply(const std::string& section, const std::string& key, const TomlValue& value,
               size_t line) {
        if (section == "lint") {
            apply_lint(key, value, line);
        } else if (section == "lint.rules") {
            apply_rule(key, value, line);
        } else if (section == "lint.hazards") {
            apply_hazard(key, value, line);
        } else if (section == "fix") {
            apply_fix(key, value, line);
        } else {
            MAPLINT_LOG_DEBUG("config", origin_ << ":" << line << ": ignoring [" << section << "] "
                                                << key);
        }
    }

private:
    Settings& settings_;
    const std::string& origin_;

    void warn(size_t line, const std::string& message) {
        MAPLINT_LOG_WARN("config", origin_ << ":" << line << ": " << message);
    }

    void apply_lint(const std::string& key, const TomlValue& value, size_t line) {
        auto& options = settings_.analyzer;
        if (key == "fail-on") {
            if (value.kind == ValueKind::String && value.string == "never") {
                settings_.fail_on = std::nullopt;
            } else if (auto severity = value.kind == ValueKind::String
                                           ? analysis::parse_severity(value.string)
                                           : std::nullopt) {
                settings_.fail_on = *severity;
            } else {
                warn(line, "fail-on expects \"error\", \"warning\", \"info\" or \"never\"");
            }
        } else if (key == "min-severity") {
            if (auto severity = value.kind == ValueKind::String
                                    ? analysis::parse_severity(value.string)
                                    : std::nullopt) {
                options.min_severity = *severity;
            } else {
                warn(line, "min-severity expects \"error\", \"warning\" or \"info\"");
            }
        } else if (key == "check-missing-destination" || key == "check-duplicates") {
            if (value.kind != ValueKind::Bool) {
                warn(line, key + " expects true or false");
                return;
            }
            (key == "check-duplicates" ? options.check_duplicates
                                       : options.check_missing_destination) = value.boolean;
        } else {
            warn(line, "unknown key '" + key + "' in [lint]");
        }
    }

    void apply_rule(const std::string& key, const TomlValue& value, size_t line) {
        auto rules = analysis::rules_matching(key);
        if (rules.empty()) {
            warn(line, "unknown rule '" + key + "'");
            return;
        }

        bool disable = (value.kind == ValueKind::Bool && !value.boolean) ||
                       (value.kind == ValueKind::String && value.string == "off");
        bool enable = (value.kind == ValueKind::Bool && value.boolean) ||
                      (value.kind == ValueKind::String && value.string == "on");
        auto severity = value.kind == ValueKind::String ? analysis::parse_severity(value.string)
                                                        : std::nullopt;
        if (!disable && !enable && !severity) {
            warn(line, "rule '" + key + "' expects true, false, \"off\" or a severity");
            return;
        }

        for (auto rule : rules) {
            if (disable) {
                settings_.analyzer.disabled_rules.insert(rule);
            } else {
                settings_.analyzer.disabled_rules.erase(rule);
                if (severity) {
                    settings_.analyzer.severity_overrides[rule] = *severity;
                }
            }
        }
    }

    void apply_hazard(const std::string& key, const TomlValue& value, size_t line) {
        if (value.kind != ValueKind::Array) {
            warn(line, key + " expects an array of strings");
            return;
        }
        if (key == "data-access") {
            settings_.analyzer.patterns.data_access = value.array;
        } else if (key == "http") {
            settings_.analyzer.patterns.http = value.array;
        } else {
            warn(line, "unknown key '" + key + "' in [lint.hazards]");
        }
    }

    void apply_fix(const std::string& key, const TomlValue& value, size_t line) {
        if (key != "max-iterations") {
            warn(line, "unknown key '" + key + "' in [fix]");
            return;
        }
        if (value.kind != ValueKind::Integer || value.integer < 1 || value.integer > 10000) {
            warn(line, "max-iterations expects an integer between 1 and 10000");
            return;
        }
        settings_.max_fix_iterations = static_cast<int>(value.integer);
    }
};

} // namespace

auto parse_config(std::string_view text, const std::string& origin)
    -> Result<Settings, ConfigError> {
    Settings settings;
    ConfigReader reader(settings, origin);

    std::string section;
    std::istringstream input{std::string(text)};
    std::string raw_line;
    size_t line_no = 0;

    while (std::getline(input, raw_line)) {
        ++line_no;
        auto line = trim(strip_comment(raw_line));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']' || line.size() < 3) {
                return ConfigError{"malformed section header", origin, line_no};
            }
            section = std::string(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            return ConfigError{"expected 'key = value'", origin, line_no};
        }
        std::string key(trim(line.substr(0, eq)));
        std::string value_text(trim(line.substr(eq + 1)));
        if (key.empty()) {
            return ConfigError{"missing key before '='", origin, line_no};
        }
        if (key.size() >= 2 && key.front() == '"' && key.back() == '"') {
            key = key.substr(1, key.size() - 2);
        }

        // Arrays may continue over several lines.
        size_t start_line = line_no;
        if (!value_text.empty() && value_text.front() == '[') {
            while (value_text.back() != ']') {
                if (!std::getline(input, raw_line)) {
                    return ConfigError{"unterminated array", origin, start_line};
                }
                ++line_no;
                value_text += " ";
                value_text += trim(strip_comment(raw_line));
            }
        }

        auto value = parse_value(value_text);
        if (value.kind == ValueKind::Invalid) {
            MAPLINT_LOG_WARN("config", origin << ":" << start_line << ": ignoring malformed value '"
                                              << value_text << "' for " << key);
            continue;
        }
        reader.apply(section, key, value, start_line);
    }

    return settings;
}

auto load_config(const std::filesystem::path& path) -> Result<Settings, ConfigError> {
    std::ifstream file(path);
    if (!file) {
        return ConfigError{"cannot read configuration file", path.string(), 0};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    MAPLINT_LOG_DEBUG("config", "Loading " << path.string());
    return parse_config(buffer.str(), path.string());
}

auto find_config(const std::filesystem::path& dir) -> std::optional<std::filesystem::path> {
    auto candidate = dir / CONFIG_FILE_NAME;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}

} // namespace maplint::config
