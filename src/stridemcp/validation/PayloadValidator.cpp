//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PayloadValidator.cpp
// Purpose: Single-pass bounded JSON decoder enforcing payload limits
//==========================================================================================================

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <sstream>
#include <vector>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "stridemcp/validation/PayloadValidator.h"

namespace stridemcp {
namespace validation {

using errors::ErrorKind;

namespace {

// Internal signal from the decoder; converted to ValidationFailure at the ValidatePayload boundary.
struct DecodeAbort {
    ValidationFailure failure;
};

// Returns the byte offset of the first invalid UTF-8 sequence, or npos when the input is valid.
std::size_t findInvalidUtf8(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) { ++i; continue; }
        std::size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else { return i; }
        if (i + len > s.size()) return i;
        for (std::size_t k = 1; k < len; ++k) {
            const unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Reject overlong forms, surrogates and values beyond U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return i;
        if (cp >= 0xD800 && cp <= 0xDFFF) return i;
        if (cp > 0x10FFFF) return i;
        i += len;
    }
    return std::string_view::npos;
}

constexpr std::size_t kMaxKeyInPath = 64;
constexpr std::size_t kMaxLoggedPath = 512;

// ".key" path segment with control characters and quotes escaped, cut at kMaxKeyInPath bytes
// (never inside a UTF-8 sequence). Paths are written to the server log.
std::string keySegment(const std::string& key) {
    std::string seg = ".";
    std::size_t n = std::min(key.size(), kMaxKeyInPath);
    while (n > 0 && n < key.size() && (static_cast<unsigned char>(key[n]) & 0xC0) == 0x80) --n;
    for (std::size_t k = 0; k < n; ++k) {
        const unsigned char c = static_cast<unsigned char>(key[k]);
        switch (c) {
            case '\n': seg += "\\n"; break;
            case '\r': seg += "\\r"; break;
            case '\t': seg += "\\t"; break;
            case '\\': seg += "\\\\"; break;
            case '"': seg += "\\\""; break;
            default:
                if (c < 0x20 || c == 0x7F) {
                    seg += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    seg.push_back(static_cast<char>(c));
                }
        }
    }
    if (key.size() > kMaxKeyInPath) seg += "...";
    return seg;
}

void appendUtf8(std::string& out, uint32_t code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

class BoundedDecoder {
public:
    BoundedDecoder(std::string_view input, const ValidationLimits& limits)
        : s(input), limits(limits), maxDepth(std::min(limits.maxJsonDepth, kMaxSupportedJsonDepth)) {}

    JSONValue decodeDocument() {
        skipWs();
        if (i >= s.size()) {
            malformed("empty document");
        }
        JSONValue root = parseValue();
        skipWs();
        if (i != s.size()) {
            malformed("trailing characters after document");
        }
        return root;
    }

private:
    std::string_view s;
    const ValidationLimits& limits;
    const std::size_t maxDepth;
    std::size_t i{0};
    std::size_t depth{0};
    std::vector<std::string> path;

    std::string currentPath() const {
        std::string p = "$";
        for (const auto& seg : path) p += seg;
        return p;
    }

    [[noreturn]] void malformed(const std::string& what) const {
        ValidationFailure f;
        f.kind = ErrorKind::MalformedJSON;
        f.path = currentPath();
        f.depth = depth;
        f.offset = i;
        f.detail = what;
        throw DecodeAbort{std::move(f)};
    }

    [[noreturn]] void tooComplex(const char* constraint, std::size_t limit) const {
        ValidationFailure f;
        f.kind = ErrorKind::PayloadTooComplex;
        f.constraint = constraint;
        f.path = currentPath();
        f.depth = depth;
        f.offset = i;
        std::ostringstream oss;
        oss << constraint << " exceeded (limit " << limit << ")";
        f.detail = oss.str();
        throw DecodeAbort{std::move(f)};
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    void enterContainer() {
        ++depth;
        if (depth > maxDepth) {
            tooComplex("maxJsonDepth", maxDepth);
        }
    }

    uint32_t parseHex4() {
        if (i + 4 > s.size()) malformed("truncated unicode escape");
        uint32_t code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            const char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') code += static_cast<uint32_t>(10 + (h - 'a'));
            else if (h >= 'A' && h <= 'F') code += static_cast<uint32_t>(10 + (h - 'A'));
            else malformed("invalid hex digit in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') malformed("expected string");
        ++i; // opening quote
        std::string out;
        std::size_t codePoints = 0;
        auto countCodePoint = [&]() {
            ++codePoints;
            if (codePoints > limits.maxStringLength) {
                tooComplex("maxStringLength", limits.maxStringLength);
            }
        };
        while (true) {
            if (i >= s.size()) malformed("unterminated string");
            const char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) malformed("control character in string");
            if (c != '\\') {
                // UTF-8 was validated up front; count lead bytes only
                if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) countCodePoint();
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) malformed("truncated escape");
            const char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    uint32_t code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') malformed("unpaired surrogate");
                        i += 2;
                        const uint32_t low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) malformed("invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        malformed("unpaired surrogate");
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: malformed("unknown escape");
            }
            countCodePoint();
        }
        return out;
    }

    JSONValue parseNumber() {
        const std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size()) malformed("truncated number");
        if (s[i] == '0') {
            ++i;
        } else if (s[i] >= '1' && s[i] <= '9') {
            while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
        } else {
            malformed("invalid value");
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            const std::size_t fracStart = i;
            while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
            if (i == fracStart) malformed("missing fraction digits");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            const std::size_t expStart = i;
            while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
            if (i == expStart) malformed("missing exponent digits");
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) {
                return JSONValue(v);
            }
            // Integers outside int64 fall through to double
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec == std::errc::result_out_of_range) {
            malformed("number out of range");
        }
        if (ec != std::errc() || ptr != last) {
            malformed("invalid number");
        }
        return JSONValue(d);
    }

    JSONValue parseArray() {
        ++i; // '['
        enterContainer();
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            if (arr.size() >= limits.maxArrayLength) {
                tooComplex("maxArrayLength", limits.maxArrayLength);
            }
            path.push_back("[" + std::to_string(arr.size()) + "]");
            JSONValue val = parseValue();
            path.pop_back();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) malformed("expected ',' or ']' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        ++i; // '{'
        enterContainer();
        JSONValue::Object obj;
        std::size_t members = 0;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            if (members >= limits.maxObjectKeys) {
                tooComplex("maxObjectKeys", limits.maxObjectKeys);
            }
            std::string key = parseString();
            if (!match(':')) malformed("expected ':' after key");
            path.push_back(keySegment(key));
            JSONValue val = parseValue();
            path.pop_back();
            // Duplicate keys: last one wins
            obj[std::move(key)] = std::make_shared<JSONValue>(std::move(val));
            ++members;
            if (match('}')) break;
            if (!match(',')) malformed("expected ',' or '}' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) malformed("unexpected end of document");
        const char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't') {
            if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
            malformed("invalid literal");
        }
        if (c == 'f') {
            if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
            malformed("invalid literal");
        }
        if (c == 'n') {
            if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
            malformed("invalid literal");
        }
        return parseNumber();
    }
};

} // namespace

ValidationResult ValidatePayload(std::string_view raw, const ValidationLimits& limits) {
    FUNC_SCOPE();
    ValidationResult result;
    if (raw.size() > limits.maxPayloadBytes) {
        ValidationFailure f;
        f.kind = ErrorKind::PayloadTooLarge;
        f.constraint = "maxPayloadBytes";
        f.path = "$";
        f.detail = "payload of " + std::to_string(raw.size()) + " bytes exceeds limit of " +
                   std::to_string(limits.maxPayloadBytes);
        result.failure = std::move(f);
        return result;
    }
    const std::size_t badUtf8 = findInvalidUtf8(raw);
    if (badUtf8 != std::string_view::npos) {
        ValidationFailure f;
        f.kind = ErrorKind::MalformedJSON;
        f.path = "$";
        f.offset = badUtf8;
        f.detail = "invalid UTF-8";
        result.failure = std::move(f);
        return result;
    }
    try {
        BoundedDecoder decoder(raw, limits);
        result.document = decoder.decodeDocument();
    } catch (DecodeAbort& abort) {
        result.failure = std::move(abort.failure);
    }
    return result;
}

const char* PublicMessage(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PayloadTooLarge: return "Payload too large";
        case ErrorKind::PayloadTooComplex: return "Payload too complex";
        case ErrorKind::MalformedJSON:
        default: return "Parse error";
    }
}

std::string DescribeFailure(const ValidationFailure& failure) {
    std::string logPath = failure.path.empty() ? std::string("$") : failure.path;
    if (logPath.size() > kMaxLoggedPath) {
        logPath = "..." + logPath.substr(logPath.size() - kMaxLoggedPath);
    }
    std::ostringstream oss;
    oss << errors::toString(failure.kind) << ": " << failure.detail
        << " at " << logPath
        << " (depth " << failure.depth << ", offset " << failure.offset << ")";
    return oss.str();
}

} // namespace validation
} // namespace stridemcp
