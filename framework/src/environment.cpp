#include "breakwater/environment.h"
#include "breakwater/util/string.h"
#include <fstream>
#include <cstdlib>

namespace breakwater {

    bool load_env(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            std::string_view clean_line = util::trim(line);

            if (clean_line.empty() || clean_line[0] == '#') {
                continue;
            }

            // Accept shell-style "export KEY=VALUE"
            if (clean_line.starts_with("export ")) {
                clean_line = util::trim(clean_line.substr(7));
            }

            size_t delimiter_pos = clean_line.find('=');
            if (delimiter_pos == std::string_view::npos) {
                continue; // Invalid line
            }

            std::string key(util::trim(clean_line.substr(0, delimiter_pos)));
            std::string value(util::trim(clean_line.substr(delimiter_pos + 1)));

            if (key.empty()) {
                continue;
            }

            if (value.size() >= 2 &&
               ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            setenv(key.c_str(), value.c_str(), 1);
        }

        return true;
    }
}
