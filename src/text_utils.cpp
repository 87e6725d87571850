#include "text_utils.h"

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

bool is_cjk_language(const std::string& language) {
    return language == "zh" || language == "ja" || language == "ko" || language == "yue";
}

void append_text(std::string& dst, const std::string& piece, const std::string& language) {
    std::string clean = trim(piece);
    if (clean.empty()) {
        return;
    }
    if (!dst.empty() && !is_cjk_language(language)) {
        dst += ' ';
    }
    dst += clean;
}
