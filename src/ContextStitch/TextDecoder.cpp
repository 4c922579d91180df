// =================================================================
// src/ContextStitch/TextDecoder.cpp
// =================================================================
// Implementation for strict and replacing text decoding.

#include "ContextStitch/TextDecoder.hpp"
#include <algorithm>
#include <cctype>
#include <exception>

namespace ContextStitch {

namespace {

const char* const kReplacementCharacter = "\xEF\xBF\xBD";   // U+FFFD in UTF-8
const std::string kByteOrderMark = "\xEF\xBB\xBF";

void appendCodePoint(std::string& out, unsigned int code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

} // namespace

TextDecoder::TextDecoder(TextEncoding encoding)
    : m_encoding(encoding)
{
}

std::optional<TextEncoding> TextDecoder::parseEncoding(const std::string& name) {
    std::string key;
    for (char c : name) {
        if (c == '-' || c == '_' || c == ' ') {
            continue;
        }
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (key == "utf8") return TextEncoding::Utf8;
    if (key == "utf8sig") return TextEncoding::Utf8Sig;
    if (key == "ascii" || key == "usascii") return TextEncoding::Ascii;
    if (key == "latin1" || key == "iso88591" || key == "l1") return TextEncoding::Latin1;
    return std::nullopt;
}

std::string TextDecoder::getEncodingName(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8: return "utf-8";
        case TextEncoding::Utf8Sig: return "utf-8-sig";
        case TextEncoding::Ascii: return "ascii";
        case TextEncoding::Latin1: return "latin-1";
        default: return "unknown";
    }
}

DecodeResult TextDecoder::decode(const std::string& bytes) const {
    DecodeResult result;

    try {
        switch (m_encoding) {
            case TextEncoding::Latin1:
                // Every byte is a valid code point
                decodeLatin1(bytes, result.text);
                result.status = DecodeStatus::Strict;
                return result;

            case TextEncoding::Ascii:
                if (decodeAscii(bytes, false, result.text, result.replacements)) {
                    result.status = DecodeStatus::Strict;
                    return result;
                }
                result.text.clear();
                result.replacements = 0;
                decodeAscii(bytes, true, result.text, result.replacements);
                result.status = DecodeStatus::Fallback;
                return result;

            case TextEncoding::Utf8:
            case TextEncoding::Utf8Sig: {
                std::string input;
                if (m_encoding == TextEncoding::Utf8Sig &&
                    bytes.compare(0, kByteOrderMark.size(), kByteOrderMark) == 0) {
                    input = bytes.substr(kByteOrderMark.size());
                } else {
                    input = bytes;
                }

                if (decodeUtf8(input, false, result.text, result.replacements)) {
                    result.status = DecodeStatus::Strict;
                    return result;
                }
                result.text.clear();
                result.replacements = 0;
                decodeUtf8(input, true, result.text, result.replacements);
                result.status = DecodeStatus::Fallback;
                return result;
            }
        }
    } catch (const std::exception& e) {
        result.text.clear();
        result.status = DecodeStatus::Failed;
        result.cause = e.what();
        return result;
    }

    result.status = DecodeStatus::Failed;
    result.cause = "unsupported encoding";
    return result;
}

bool TextDecoder::decodeUtf8(const std::string& bytes, bool replace, std::string& out, size_t& replacements) {
    out.reserve(bytes.size());
    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t consumed = 0;
        if (scanSequence(bytes, pos, consumed)) {
            out.append(bytes, pos, consumed);
        } else {
            if (!replace) {
                return false;
            }
            out += kReplacementCharacter;
            replacements++;
        }
        pos += consumed;
    }
    return true;
}

bool TextDecoder::decodeAscii(const std::string& bytes, bool replace, std::string& out, size_t& replacements) {
    out.reserve(bytes.size());
    for (char c : bytes) {
        if (static_cast<unsigned char>(c) < 0x80) {
            out += c;
        } else if (replace) {
            out += kReplacementCharacter;
            replacements++;
        } else {
            return false;
        }
    }
    return true;
}

void TextDecoder::decodeLatin1(const std::string& bytes, std::string& out) {
    out.reserve(bytes.size() + bytes.size() / 4);
    for (char c : bytes) {
        appendCodePoint(out, static_cast<unsigned char>(c));
    }
}

bool TextDecoder::scanSequence(const std::string& bytes, size_t pos, size_t& consumed) {
    const unsigned char lead = static_cast<unsigned char>(bytes[pos]);
    consumed = 1;

    if (lead < 0x80) {
        return true;
    }

    // Expected continuation count and the allowed range of the first one
    size_t expected = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        expected = 1;
    } else if (lead == 0xE0) {
        expected = 2;
        low = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        expected = 2;
    } else if (lead == 0xED) {
        expected = 2;
        high = 0x9F;    // no surrogates
    } else if (lead == 0xF0) {
        expected = 3;
        low = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        expected = 3;
    } else if (lead == 0xF4) {
        expected = 3;
        high = 0x8F;    // nothing above U+10FFFF
    } else {
        return false;
    }

    for (size_t k = 1; k <= expected; ++k) {
        if (pos + k >= bytes.size()) {
            return false;
        }
        const unsigned char byte = static_cast<unsigned char>(bytes[pos + k]);
        const unsigned char min = k == 1 ? low : 0x80;
        const unsigned char max = k == 1 ? high : 0xBF;
        if (byte < min || byte > max) {
            return false;
        }
        consumed = k + 1;
    }

    return true;
}

} // namespace ContextStitch
