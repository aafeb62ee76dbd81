#include <breakwater/util/string.h>
#include <string_view>

namespace breakwater::util {

std::string_view trim(std::string_view str) {
    const size_t first = str.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const size_t last = str.find_last_not_of(" \t\r");
    return str.substr(first, last - first + 1);
}

} // namespace breakwater::util
