// =================================================================
// include/ContextStitch/FileClassifier.hpp
// =================================================================
// Header for per-file size, binary and decoding checks.

#pragma once

#include "ContextStitch/TextDecoder.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace ContextStitch {

/**
 * @brief Final outcome for one candidate file
 */
enum class FileStatus {
    Included,
    SkippedBinary,
    SkippedOversize,
    SkippedUnreadable
};

std::string getStatusName(FileStatus status);

/**
 * @brief Classification result for one candidate file
 *
 * Only Included verdicts carry text; skipped ones carry a reason.
 */
struct FileVerdict {
    std::string relative_path;
    FileStatus status = FileStatus::SkippedUnreadable;
    std::uintmax_t size_bytes = 0;
    std::string text;
    std::string encoding;          ///< Encoding used to decode, Included only
    bool used_fallback = false;    ///< Invalid sequences were replaced
    size_t replacements = 0;
    std::string reason;

    bool isIncluded() const { return status == FileStatus::Included; }
};

/**
 * @brief Decides whether a candidate file is included as text
 *
 * Checks run cheapest first: the size ceiling (from stat alone), then a
 * binary sniff over the first kSniffBytes bytes, then a full decode.
 * classify() never throws and keeps no state between calls, so one
 * classifier can serve several threads.
 */
class FileClassifier {
public:
    static constexpr size_t kSniffBytes = 8000;
    static constexpr double kMaxNonTextRatio = 0.30;

    /**
     * @param max_file_size Largest size in bytes that is still read
     * @param encoding Preferred source encoding
     */
    FileClassifier(std::uintmax_t max_file_size, TextEncoding encoding);

    /**
     * @brief Classify one file
     * @param path Path used to open the file
     * @param relative_path Path reported in the verdict
     */
    FileVerdict classify(const std::filesystem::path& path, const std::string& relative_path) const;

    /**
     * @brief Binary sniff over a content prefix
     *
     * A NUL byte is always binary. Otherwise the sample is binary when more
     * than kMaxNonTextRatio of it lies outside BEL, BS, TAB, LF, FF, CR, ESC
     * and 0x20-0xFF.
     */
    static bool looksBinary(const std::string& sample);

private:
    std::uintmax_t m_max_file_size;
    TextDecoder m_decoder;
};

} // namespace ContextStitch
