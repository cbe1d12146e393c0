#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <boost/beast/core/detail/base64.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/string_generator.hpp>
#include "server_config.hpp"

namespace keypub {

// A client-caused rejection. what() is the user-visible reason.
class ValidationError : public std::runtime_error {
public:
    enum class Kind {
        EMPTY,
        INVALID_CHARS,
        TOO_LONG,
        NOT_BASE64,
        WRONG_KEY_LENGTH,
        INVALID_ID
    };

    ValidationError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};


// Format checks for submitted keys, notes and record ids.
// All checks are pure; the first failing rule throws ValidationError.
class InputValidator {
public:
    /**
     * Validates a submitted public key.
     * Rules, in order: non-empty after trimming, no whitespace or control
     * characters, at most 1000 bytes, strict padded Base64, decodes to
     * exactly 32 bytes. Only the length is checked; the bytes are not
     * verified to be a point on the curve.
     * @return The trimmed key text, unchanged otherwise.
     */
    static std::string validate_public_key(const std::string& raw) {
        std::string key = trim(raw);
        if (key.empty()) {
            throw ValidationError(ValidationError::Kind::EMPTY, "public_key must not be empty");
        }
        if (contains_space_or_control(key)) {
            throw ValidationError(ValidationError::Kind::INVALID_CHARS,
                                  "public_key cannot contain whitespace or control characters");
        }
        if (key.size() > ServerConfig::max_public_key_bytes) {
            throw ValidationError(ValidationError::Kind::TOO_LONG, "public_key must be at most 1000 bytes");
        }

        auto decoded = decode_base64(key);
        if (!decoded) {
            throw ValidationError(ValidationError::Kind::NOT_BASE64, "public_key must be valid base64");
        }
        if (decoded->size() != ServerConfig::public_key_raw_bytes) {
            throw ValidationError(ValidationError::Kind::WRONG_KEY_LENGTH,
                                  "public_key must be base64 of a 32-byte key (ED25519)");
        }
        return key;
    }

    // Trims the note; blank becomes absent. Limit is 100 bytes after trimming.
    static std::optional<std::string> validate_note(const std::optional<std::string>& raw) {
        if (!raw) return std::nullopt;
        std::string note = trim(*raw);
        if (note.empty()) return std::nullopt;
        if (note.size() > ServerConfig::max_note_bytes) {
            throw ValidationError(ValidationError::Kind::TOO_LONG, "note must be at most 100 bytes");
        }
        return note;
    }

    /**
     * Path ids must parse as a UUID before they get anywhere near the store.
     * Accepted spellings: 32 hex digits, hyphenated 8-4-4-4-12, and the
     * hyphenated form wrapped in braces or prefixed with "urn:uuid:".
     */
    static boost::uuids::uuid validate_record_id(const std::string& raw) {
        std::string text = raw;
        bool wrapped = false;
        if (text.rfind("urn:uuid:", 0) == 0) {
            text.erase(0, 9);
            wrapped = true;
        } else if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
            text = text.substr(1, text.size() - 2);
            wrapped = true;
        }

        bool hyphenated = text.size() == 36 && text[8] == '-' && text[13] == '-' &&
                          text[18] == '-' && text[23] == '-';
        bool simple = !wrapped && text.size() == 32;
        if (!hyphenated && !simple) {
            throw ValidationError(ValidationError::Kind::INVALID_ID, "invalid record id (must be a UUID)");
        }

        try {
            return boost::uuids::string_generator()(text);
        } catch (const std::runtime_error&) {
            throw ValidationError(ValidationError::Kind::INVALID_ID, "invalid record id (must be a UUID)");
        }
    }

    /**
     * Strict standard-alphabet Base64: length a multiple of four, at most
     * two trailing '=', and no stray bits in the final symbol.
     * @return Decoded bytes, or std::nullopt if the text is not canonical Base64.
     */
    static std::optional<std::vector<unsigned char>> decode_base64(const std::string& text) {
        if (text.size() % 4 != 0) return std::nullopt;

        size_t pad = 0;
        while (pad < text.size() && text[text.size() - 1 - pad] == '=') ++pad;
        if (pad > 2) return std::nullopt;

        const size_t data_len = text.size() - pad;
        for (size_t i = 0; i < data_len; ++i) {
            if (base64_value(text[i]) < 0) return std::nullopt;
        }

        if (pad > 0) {
            int last = base64_value(text[data_len - 1]);
            int mask = (pad == 1) ? 0x03 : 0x0F;
            if ((last & mask) != 0) return std::nullopt;
        }

        std::vector<unsigned char> out(boost::beast::detail::base64::decoded_size(text.size()));
        auto result = boost::beast::detail::base64::decode(out.data(), text.data(), text.size());
        const size_t expected = text.size() / 4 * 3 - pad;
        if (result.first != expected) return std::nullopt;
        out.resize(result.first);
        return out;
    }

    // Strips leading and trailing Unicode whitespace from UTF-8 text.
    static std::string trim(const std::string& s) {
        size_t begin = 0;
        while (begin < s.size()) {
            size_t next = begin;
            char32_t cp = 0;
            if (!next_code_point(s, next, cp) || !is_whitespace(cp)) break;
            begin = next;
        }

        size_t end = s.size();
        while (end > begin) {
            size_t start = end - 1;
            while (start > begin && (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) --start;
            size_t pos = start;
            char32_t cp = 0;
            if (!next_code_point(s, pos, cp) || pos != end || !is_whitespace(cp)) break;
            end = start;
        }
        return s.substr(begin, end - begin);
    }

    // True for any whitespace, control character, or malformed UTF-8 sequence.
    static bool contains_space_or_control(const std::string& s) {
        size_t pos = 0;
        while (pos < s.size()) {
            char32_t cp = 0;
            if (!next_code_point(s, pos, cp)) return true;
            if (is_whitespace(cp) || is_control(cp)) return true;
        }
        return false;
    }

    static bool is_valid_utf8(const std::string& s) {
        size_t pos = 0;
        char32_t cp = 0;
        while (pos < s.size()) {
            if (!next_code_point(s, pos, cp)) return false;
        }
        return true;
    }

    // Unicode White_Space property.
    static bool is_whitespace(char32_t cp) {
        return (cp >= 0x09 && cp <= 0x0D) || cp == 0x20 || cp == 0x85 || cp == 0xA0 ||
               cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
               cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
    }

    // General category Cc.
    static bool is_control(char32_t cp) {
        return cp <= 0x1F || (cp >= 0x7F && cp <= 0x9F);
    }

private:
    static int base64_value(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }

    // Decodes one UTF-8 sequence at pos, advancing pos. Rejects overlong
    // forms, surrogates and values above U+10FFFF.
    static bool next_code_point(const std::string& s, size_t& pos, char32_t& cp) {
        auto byte = [&](size_t i) { return static_cast<unsigned char>(s[i]); };
        unsigned char lead = byte(pos);
        size_t len;
        char32_t min;
        if (lead < 0x80) {
            cp = lead;
            ++pos;
            return true;
        } else if ((lead & 0xE0) == 0xC0) {
            len = 2; cp = lead & 0x1F; min = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3; cp = lead & 0x0F; min = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4; cp = lead & 0x07; min = 0x10000;
        } else {
            return false;
        }
        if (pos + len > s.size()) return false;
        for (size_t i = 1; i < len; ++i) {
            unsigned char c = byte(pos + i);
            if ((c & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (c & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        pos += len;
        return true;
    }
};

}
