#pragma once
#include <string>
#include <vector>

namespace textutil {

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string s);

// lowercase, keep letters/digits, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text into tokens, drop empty tokens
std::vector<std::string> tokenize(const std::string& normalized);

bool contains_ci(const std::string& haystack, const std::string& needle);
bool iequals(const std::string& a, const std::string& b);

// Trigram similarity in [0,1] (pg_trgm semantics: words padded with two leading and
// one trailing blank, Jaccard over the trigram sets).
double trigram_similarity(const std::string& a, const std::string& b);

std::vector<std::string> split_lines(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// At most `max_bytes` of `s`, never ending inside a UTF-8 sequence.
std::string utf8_prefix(const std::string& s, size_t max_bytes);

}  // namespace textutil
