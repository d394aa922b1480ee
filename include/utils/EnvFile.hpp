#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Yturl {

/**
 * KEY=VALUE style file (docker-compose .env)
 * Unrelated lines and their order are preserved on save
 */
class EnvFile {
public:
    explicit EnvFile(std::string path);

    // Read the file; a missing file loads as empty and returns false
    bool load();

    // Write all lines back
    bool save() const;

    std::optional<std::string> get(const std::string& key) const;

    // Replace the first KEY= line in place, or append one
    void set(const std::string& key, const std::string& value);

    const std::string& getPath() const { return path; }

private:
    std::string path;
    std::vector<std::string> lines;
};

} // namespace Yturl
