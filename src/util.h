#pragma once
#include <cstdint>
#include <string>

int64_t now_ms();

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-19T08:15:30.123Z
std::string iso_time(int64_t ms);

// Appends one line to path. No-op when path is empty.
void append_jsonl(const std::string& path, const std::string& line);

std::string to_lower(std::string s);
bool contains_icase(const std::string& haystack, const std::string& needle);
