#pragma once
#include <string>

std::string trim(const std::string& text);

// 中日韩文本直接拼接, 其他语言之间用空格分隔
void append_text(std::string& dst, const std::string& piece, const std::string& language);

bool is_cjk_language(const std::string& language);
