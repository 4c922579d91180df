// =================================================================
// include/ContextStitch/TextDecoder.hpp
// =================================================================
// Two-step text decoding: strict first, then with replacement characters.

#pragma once

#include <optional>
#include <string>

namespace ContextStitch {

/**
 * @brief Source encodings understood by the decoder
 */
enum class TextEncoding {
    Utf8,
    Utf8Sig,    ///< UTF-8 with an optional byte order mark that is dropped
    Ascii,
    Latin1
};

/**
 * @brief How a decode attempt ended
 */
enum class DecodeStatus {
    Strict,     ///< Every byte was valid in the requested encoding
    Fallback,   ///< Invalid sequences were replaced with U+FFFD
    Failed      ///< No text could be produced
};

/**
 * @brief Tagged outcome of a decode; text is always UTF-8
 */
struct DecodeResult {
    DecodeStatus status = DecodeStatus::Failed;
    std::string text;
    size_t replacements = 0;
    std::string cause;
};

class TextDecoder {
public:
    explicit TextDecoder(TextEncoding encoding = TextEncoding::Utf8);

    /**
     * @brief Look up an encoding by name (case-insensitive, '-' and '_' optional)
     * @return std::nullopt for names the decoder does not support
     */
    static std::optional<TextEncoding> parseEncoding(const std::string& name);

    static std::string getEncodingName(TextEncoding encoding);

    /**
     * @brief Decode raw bytes
     *
     * Tries a strict decode first; if any sequence is invalid, decodes again
     * substituting U+FFFD for each invalid sequence. Never throws.
     */
    DecodeResult decode(const std::string& bytes) const;

    TextEncoding getEncoding() const { return m_encoding; }

private:
    TextEncoding m_encoding;

    /**
     * @brief Decode UTF-8, optionally replacing invalid sequences
     * @return false on the first invalid sequence when not replacing
     */
    static bool decodeUtf8(const std::string& bytes, bool replace, std::string& out, size_t& replacements);
    static bool decodeAscii(const std::string& bytes, bool replace, std::string& out, size_t& replacements);
    static void decodeLatin1(const std::string& bytes, std::string& out);

    /**
     * @brief Examine the UTF-8 sequence starting at bytes[pos]
     * @param consumed Sequence length if valid, otherwise the length of the
     *        maximal invalid subpart (at least 1)
     * @return true if the sequence is well formed
     */
    static bool scanSequence(const std::string& bytes, size_t pos, size_t& consumed);
};

} // namespace ContextStitch
