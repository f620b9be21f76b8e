#include "utils.hpp"
#include <platform/platform.hpp>
#include <cctype>
#include <cstdlib>
#include <sstream>

static bool is_var_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string expand_path(const std::string& path) {
    std::string in = path;

    // "~" or "~/..." → home directory
    if (!in.empty() && in[0] == '~' && (in.size() == 1 || in[1] == '/')) {
        in = platform::home_dir().string() + in.substr(1);
    }

    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); i++) {
        if (in[i] != '$' || i + 1 >= in.size()) {
            out += in[i];
            continue;
        }

        size_t name_start;
        size_t name_end;
        size_t resume;
        if (in[i + 1] == '{') {
            auto close = in.find('}', i + 2);
            if (close == std::string::npos) { out += in[i]; continue; }
            name_start = i + 2;
            name_end = close;
            resume = close + 1;
        } else {
            name_start = i + 1;
            name_end = name_start;
            while (name_end < in.size() && is_var_char(in[name_end])) name_end++;
            resume = name_end;
        }

        std::string name = in.substr(name_start, name_end - name_start);
        const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
        if (value) {
            out += value;
        } else {
            out += in.substr(i, resume - i);
        }
        i = resume - 1;
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        trim(line);
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}
