#include "utils/EnvFile.hpp"
#include <fstream>

namespace Yturl {

EnvFile::EnvFile(std::string path)
    : path(std::move(path)) {
}

bool EnvFile::load() {
    lines.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return true;
}

bool EnvFile::save() const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        file << lines[i];
        if (i + 1 < lines.size()) {
            file << '\n';
        }
    }
    file << '\n';
    return static_cast<bool>(file);
}

std::optional<std::string> EnvFile::get(const std::string& key) const {
    const std::string prefix = key + "=";
    for (const auto& line : lines) {
        if (line.compare(0, prefix.size(), prefix) == 0) {
            std::string value = line.substr(prefix.size());
            // Strip optional surrounding quotes
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'')
                && value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            return value;
        }
    }
    return std::nullopt;
}

void EnvFile::set(const std::string& key, const std::string& value) {
    const std::string prefix = key + "=";
    for (auto& line : lines) {
        if (line.compare(0, prefix.size(), prefix) == 0) {
            line = prefix + value;
            return;
        }
    }

    // Drop trailing blank lines so the appended key does not follow a gap
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    lines.push_back(prefix + value);
}

} // namespace Yturl
