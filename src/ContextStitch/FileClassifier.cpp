// =================================================================
// src/ContextStitch/FileClassifier.cpp
// =================================================================
// Implementation for candidate file classification.

#include "ContextStitch/FileClassifier.hpp"
#include <fstream>
#include <vector>

namespace ContextStitch {

namespace fs = std::filesystem;

std::string getStatusName(FileStatus status) {
    switch (status) {
        case FileStatus::Included: return "included";
        case FileStatus::SkippedBinary: return "binary";
        case FileStatus::SkippedOversize: return "oversize";
        case FileStatus::SkippedUnreadable: return "unreadable";
        default: return "unknown";
    }
}

FileClassifier::FileClassifier(std::uintmax_t max_file_size, TextEncoding encoding)
    : m_max_file_size(max_file_size),
      m_decoder(encoding)
{
}

FileVerdict FileClassifier::classify(const fs::path& path, const std::string& relative_path) const {
    FileVerdict verdict;
    verdict.relative_path = relative_path;

    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (ec) {
        verdict.reason = "cannot stat: " + ec.message();
        return verdict;
    }
    if (!fs::is_regular_file(status)) {
        verdict.reason = "not a regular file";
        return verdict;
    }

    std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        verdict.reason = "cannot read size: " + ec.message();
        return verdict;
    }
    verdict.size_bytes = size;

    // Oversize files are rejected before any content is read
    if (size > m_max_file_size) {
        verdict.status = FileStatus::SkippedOversize;
        verdict.reason = std::to_string(size) + " bytes exceeds limit of " +
                         std::to_string(m_max_file_size) + " bytes";
        return verdict;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        verdict.reason = "cannot open file";
        return verdict;
    }

    std::string content(kSniffBytes, '\0');
    file.read(&content[0], static_cast<std::streamsize>(kSniffBytes));
    content.resize(static_cast<size_t>(file.gcount()));
    if (file.bad()) {
        verdict.reason = "read error";
        return verdict;
    }

    if (looksBinary(content)) {
        verdict.status = FileStatus::SkippedBinary;
        verdict.reason = "binary content";
        return verdict;
    }

    // Bounded read of the remainder; the file may have grown since stat
    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        content.append(buffer.data(), static_cast<size_t>(file.gcount()));
        if (content.size() > m_max_file_size) {
            verdict.status = FileStatus::SkippedOversize;
            verdict.size_bytes = content.size();
            verdict.reason = "file grew beyond limit of " + std::to_string(m_max_file_size) + " bytes";
            return verdict;
        }
    }
    if (file.bad()) {
        verdict.reason = "read error";
        return verdict;
    }

    DecodeResult decoded = m_decoder.decode(content);
    if (decoded.status == DecodeStatus::Failed) {
        verdict.reason = "cannot decode: " + decoded.cause;
        return verdict;
    }

    verdict.status = FileStatus::Included;
    verdict.size_bytes = content.size();
    verdict.text = std::move(decoded.text);
    verdict.encoding = TextDecoder::getEncodingName(m_decoder.getEncoding());
    verdict.used_fallback = decoded.status == DecodeStatus::Fallback;
    verdict.replacements = decoded.replacements;
    return verdict;
}

bool FileClassifier::looksBinary(const std::string& sample) {
    if (sample.empty()) {
        return false;
    }

    size_t non_text = 0;
    for (char c : sample) {
        const unsigned char byte = static_cast<unsigned char>(c);
        if (byte == 0) {
            return true;
        }
        const bool text = byte >= 0x20 || byte == 7 || byte == 8 || byte == 9 ||
                          byte == 10 || byte == 12 || byte == 13 || byte == 27;
        if (!text) {
            non_text++;
        }
    }

    return static_cast<double>(non_text) / static_cast<double>(sample.size()) > kMaxNonTextRatio;
}

} // namespace ContextStitch
