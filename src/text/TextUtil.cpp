#include "text/TextUtil.hpp"
#include <cctype>

namespace kwe {
namespace textutil {

static bool is_currency(uint32_t cp) {
    return cp == '$' || cp == 0xA3 || cp == 0x20AC; // $ £ €
}

static bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

std::string trim(const std::string& s) {
    size_t i = 0, j = s.size();
    while (i < j && std::isspace((unsigned char)s[i])) ++i;
    while (j > i && std::isspace((unsigned char)s[j - 1])) --j;
    return s.substr(i, j - i);
}

uint32_t decode_utf8(const std::string& s, size_t pos, size_t& len) {
    const unsigned char c = (unsigned char)s[pos];
    len = 1;
    if (c < 0x80) return c;

    size_t need = 0;
    uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) { need = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { need = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { need = 3; cp = c & 0x07; }
    else return c;

    if (pos + need >= s.size()) return c;
    for (size_t k = 1; k <= need; ++k) {
        const unsigned char cc = (unsigned char)s[pos + k];
        if (!is_continuation(cc)) return c;
        cp = (cp << 6) | (cc & 0x3F);
    }
    len = need + 1;
    return cp;
}

bool is_word_code_point(uint32_t cp) {
    if (cp < 0x80) {
        return std::isalnum((int)cp) || cp == '_' || cp == '\'' || cp == '-';
    }
    if (cp >= 0xA0 && cp <= 0xBF) return cp == 0xAA || cp == 0xB5 || cp == 0xBA;
    if (cp >= 0x2000 && cp <= 0x206F) return false;
    if (cp >= 0x3000 && cp <= 0x303F) return false;
    return true;
}

bool word_char_at(const std::string& s, size_t pos) {
    if (pos >= s.size()) return false;
    size_t len = 0;
    return is_word_code_point(decode_utf8(s, pos, len));
}

bool word_char_before(const std::string& s, size_t pos) {
    if (pos == 0 || pos > s.size()) return false;

    // walk back to the lead byte of the previous code point
    size_t start = pos - 1;
    while (start > 0 && pos - start < 4 && is_continuation((unsigned char)s[start])) --start;

    size_t len = 0;
    const uint32_t cp = decode_utf8(s, start, len);
    if (start + len != pos) return word_char_at(s, pos - 1);
    return is_word_code_point(cp);
}

std::vector<std::string> tokenize_words(const std::string& sentence) {
    std::vector<std::string> tokens;
    std::string cur;

    size_t i = 0;
    while (i < sentence.size()) {
        size_t len = 0;
        const uint32_t cp = decode_utf8(sentence, i, len);

        // a currency sign directly followed by a digit starts an amount
        if (is_currency(cp) && cur.empty() && i + len < sentence.size() &&
            std::isdigit((unsigned char)sentence[i + len])) {
            cur.append(sentence, i, len);
            size_t j = i + len;
            while (j < sentence.size() &&
                   (std::isdigit((unsigned char)sentence[j]) || sentence[j] == '.')) {
                cur.push_back(sentence[j]);
                ++j;
            }
            tokens.push_back(cur);
            cur.clear();
            i = j;
            continue;
        }

        if (is_word_code_point(cp)) {
            cur.append(sentence, i, len);
        } else if (!cur.empty()) {
            tokens.push_back(cur);
            cur.clear();
        }
        i += len;
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

bool is_punctuation_token(const std::string& token) {
    size_t i = 0;
    while (i < token.size()) {
        size_t len = 0;
        const uint32_t cp = decode_utf8(token, i, len);
        if (cp < 0x80 ? std::isalnum((int)cp) != 0 : is_word_code_point(cp)) return false;
        i += len;
    }
    return true;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

}  // namespace textutil
}  // namespace kwe
