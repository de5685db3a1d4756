#include <fstream>
#include <vecstore/config/config_helpers.h>

namespace vecstore::config {

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    return std::nullopt;
}

std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;
    const std::string dottedPrefix = section + ".";

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments from unquoted values
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        if (currentSection == section) {
            values[k] = unquote(v);
        } else if (currentSection.empty() && k.rfind(dottedPrefix, 0) == 0) {
            values[k.substr(dottedPrefix.size())] = unquote(v);
        }
    }

    return values;
}

} // namespace vecstore::config
