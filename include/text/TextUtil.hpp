#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace kwe {
namespace textutil {

// lowercase ASCII letters only, bytes >= 0x80 pass through untouched
std::string to_lower_ascii(std::string s);

std::string trim(const std::string& s);

// Code point starting at s[pos]; len receives its byte length. A malformed
// sequence decodes as the single byte.
uint32_t decode_utf8(const std::string& s, size_t pos, size_t& len);

// [A-Za-z0-9_'-] and every non-ASCII code point except the Latin-1 symbols
// (U+00A0-U+00BF but for ª µ º), general punctuation (U+2000-U+206F) and
// CJK punctuation (U+3000-U+303F)
bool is_word_code_point(uint32_t cp);

// whether a word character starts at / ends right before byte offset pos
bool word_char_at(const std::string& s, size_t pos);
bool word_char_before(const std::string& s, size_t pos);

// words are runs of word code points; "$12.50", "€12", "£3" are kept as one token
std::vector<std::string> tokenize_words(const std::string& sentence);

// true when the token has no letter or digit ("-", "'", "__")
bool is_punctuation_token(const std::string& token);

std::string join(const std::vector<std::string>& parts, const std::string& sep = " ");

}  // namespace textutil
}  // namespace kwe
