#pragma once
#include <string>

// Append-only run log. Every entry is written with a single write(2).
namespace Logger {
bool open(const std::string& path);
void log(const std::string& msg);
void close();
bool isOpen();
}
