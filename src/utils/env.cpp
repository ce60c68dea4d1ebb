#include "flakelib/utils/env.hpp"

#include <cstdlib>

namespace flakelib::utils {

std::optional<std::string> getenv_os(const std::string& key) {
    std::string os_key = key;
#ifdef _WIN32
    if (key == "HOME") {
        os_key = "USERPROFILE"; // WindowsのHOME相当
    }
#endif
    const char* value = std::getenv(os_key.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace flakelib::utils
