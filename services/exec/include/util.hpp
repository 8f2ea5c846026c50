#pragma once
#include <chrono>
#include <string>
#include <vector>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int_or(const char* key, int def);

// 32 lowercase hex characters.
std::string gen_id();

// "2026-10-19T12:34:56Z"
std::string format_time(std::chrono::system_clock::time_point tp);

std::vector<std::string> split_lines(const std::string& text);
std::size_t leading_indent(const std::string& line);
std::string trim(const std::string& s);

// Wraps text in single quotes for /bin/sh.
std::string shell_quote(const std::string& text);
