#include "platform.hpp"
#include <core/constants.hpp>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <mutex>
#include <random>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path cumulus_home() {
    return home_dir() / CUMULUS_HOME_DIR;
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path write_temp_file(const std::string& prefix, const std::string& content) {
    // pid + random for uniqueness; provisioning threads may call this concurrently
    static std::mutex rng_mutex;
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    int suffix;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        std::uniform_int_distribution<int> dist(10000, 99999);
        suffix = dist(rng);
    }

    fs::path p = temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" +
                               std::to_string(suffix));
    std::ofstream out(p, std::ios::binary);
    if (!out) return {};
    out << content;
    if (!out) return {};
    return p;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
