// =================================================================
// tests/FileClassifierTest.cpp
// =================================================================
// Unit tests for size, binary and decoding checks.

#include "ContextStitch/FileClassifier.hpp"
#include "ContextStitch/TextDecoder.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

using namespace ContextStitch;

class TextDecoderTest {
public:
    void testParseEncoding() {
        std::cout << "Testing encoding names..." << std::endl;

        assert(TextDecoder::parseEncoding("utf-8") == TextEncoding::Utf8);
        assert(TextDecoder::parseEncoding("UTF_8") == TextEncoding::Utf8);
        assert(TextDecoder::parseEncoding("utf-8-sig") == TextEncoding::Utf8Sig);
        assert(TextDecoder::parseEncoding("ASCII") == TextEncoding::Ascii);
        assert(TextDecoder::parseEncoding("Latin-1") == TextEncoding::Latin1);
        assert(TextDecoder::parseEncoding("iso-8859-1") == TextEncoding::Latin1);
        assert(!TextDecoder::parseEncoding("ebcdic").has_value());

        assert(TextDecoder::getEncodingName(TextEncoding::Utf8Sig) == "utf-8-sig");

        std::cout << "✓ Encoding name test passed" << std::endl;
    }

    void testStrictUtf8() {
        std::cout << "Testing strict UTF-8 decoding..." << std::endl;

        TextDecoder decoder;
        DecodeResult result = decoder.decode("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");

        assert(result.status == DecodeStatus::Strict);
        assert(result.text == "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
        assert(result.replacements == 0);

        std::cout << "✓ Strict UTF-8 test passed" << std::endl;
    }

    void testReplacementFallback() {
        std::cout << "Testing replacement fallback..." << std::endl;

        TextDecoder decoder;

        DecodeResult single = decoder.decode("abc\xFF" "def");
        assert(single.status == DecodeStatus::Fallback);
        assert(single.text == "abc\xEF\xBF\xBD" "def");
        assert(single.replacements == 1);

        // A truncated sequence is one maximal subpart
        DecodeResult truncated = decoder.decode("\xE2\x82" "A");
        assert(truncated.text == "\xEF\xBF\xBD" "A");
        assert(truncated.replacements == 1);

        // Surrogates and overlong forms are invalid
        DecodeResult surrogate = decoder.decode("\xED\xA0\x80");
        assert(surrogate.status == DecodeStatus::Fallback);
        DecodeResult overlong = decoder.decode("\xC0\xAF");
        assert(overlong.replacements == 2);

        std::cout << "✓ Replacement fallback test passed" << std::endl;
    }

    void testOtherEncodings() {
        std::cout << "Testing ascii, latin-1 and utf-8-sig..." << std::endl;

        TextDecoder latin1(TextEncoding::Latin1);
        DecodeResult latin = latin1.decode("caf\xE9");
        assert(latin.status == DecodeStatus::Strict);
        assert(latin.text == "caf\xC3\xA9");

        TextDecoder ascii(TextEncoding::Ascii);
        assert(ascii.decode("plain").status == DecodeStatus::Strict);
        DecodeResult high = ascii.decode("caf\xC3\xA9");
        assert(high.status == DecodeStatus::Fallback);
        assert(high.replacements == 2);

        TextDecoder sig(TextEncoding::Utf8Sig);
        assert(sig.decode("\xEF\xBB\xBFhello").text == "hello");
        assert(sig.decode("hello").text == "hello");

        TextDecoder plain;
        assert(plain.decode("\xEF\xBB\xBFhello").text == "\xEF\xBB\xBFhello" && "Plain utf-8 keeps the BOM");

        std::cout << "✓ Other encodings test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TextDecoder unit tests..." << std::endl;

        testParseEncoding();
        testStrictUtf8();
        testReplacementFallback();
        testOtherEncodings();

        std::cout << "All TextDecoder tests passed!" << std::endl;
    }
};

class FileClassifierTest {
private:
    fs::path test_dir;

    fs::path writeFile(const std::string& name, const std::string& content) {
        fs::path path = test_dir / name;
        std::ofstream(path, std::ios::binary) << content;
        return path;
    }

public:
    FileClassifierTest() : test_dir(fs::temp_directory_path() / "contextstitch_classifier_test") {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
        fs::create_directories(test_dir);
    }

    ~FileClassifierTest() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void testIncludedText() {
        std::cout << "Testing plain text files..." << std::endl;

        FileClassifier classifier(1024, TextEncoding::Utf8);
        fs::path path = writeFile("hello.py", "print('hello')\n");
        FileVerdict verdict = classifier.classify(path, "hello.py");

        assert(verdict.isIncluded());
        assert(verdict.relative_path == "hello.py");
        assert(verdict.text == "print('hello')\n");
        assert(verdict.size_bytes == 15);
        assert(verdict.encoding == "utf-8");
        assert(!verdict.used_fallback);

        FileVerdict empty = classifier.classify(writeFile("empty.txt", ""), "empty.txt");
        assert(empty.isIncluded() && empty.text.empty());

        std::cout << "✓ Included text test passed" << std::endl;
    }

    void testSizeBoundary() {
        std::cout << "Testing the size ceiling boundary..." << std::endl;

        FileClassifier classifier(10, TextEncoding::Utf8);

        FileVerdict at_limit = classifier.classify(writeFile("ten.txt", std::string(10, 'a')), "ten.txt");
        assert(at_limit.status == FileStatus::Included && "A file exactly at the ceiling is included");

        FileVerdict over = classifier.classify(writeFile("eleven.txt", std::string(11, 'a')), "eleven.txt");
        assert(over.status == FileStatus::SkippedOversize);
        assert(over.size_bytes == 11);
        assert(over.text.empty());
        assert(!over.reason.empty());

        // Oversize wins over binary: the content is never read
        FileVerdict big_binary = classifier.classify(writeFile("big.dat", std::string(20, '\0')), "big.dat");
        assert(big_binary.status == FileStatus::SkippedOversize);

        std::cout << "✓ Size boundary test passed" << std::endl;
    }

    void testBinarySniff() {
        std::cout << "Testing binary detection..." << std::endl;

        FileClassifier classifier(1024 * 1024, TextEncoding::Utf8);

        std::string with_nul = "text";
        with_nul += '\0';
        with_nul += "more";
        FileVerdict nul = classifier.classify(writeFile("nul.dat", with_nul), "nul.dat");
        assert(nul.status == FileStatus::SkippedBinary);

        // Exactly at the threshold is still text; one byte more is binary
        std::string at_threshold(70, 'a');
        at_threshold += std::string(30, '\x01');
        assert(!FileClassifier::looksBinary(at_threshold));

        std::string over_threshold(69, 'a');
        over_threshold += std::string(31, '\x01');
        assert(FileClassifier::looksBinary(over_threshold));

        std::string controls = "\a\b\t\n\f\r\x1b plain";
        assert(!FileClassifier::looksBinary(controls) && "Common control characters count as text");
        assert(!FileClassifier::looksBinary(""));

        std::string high_bytes(100, '\xE9');
        assert(!FileClassifier::looksBinary(high_bytes) && "High bytes count as text");

        std::cout << "✓ Binary sniff test passed" << std::endl;
    }

    void testLargeTextReadPastSniff() {
        std::cout << "Testing files larger than the sniff window..." << std::endl;

        FileClassifier classifier(1024 * 1024, TextEncoding::Utf8);
        std::string content(FileClassifier::kSniffBytes * 3 + 17, 'x');
        FileVerdict verdict = classifier.classify(writeFile("large.txt", content), "large.txt");

        assert(verdict.isIncluded());
        assert(verdict.text.size() == content.size());
        assert(verdict.size_bytes == content.size());

        std::cout << "✓ Large text test passed" << std::endl;
    }

    void testDecodingFallback() {
        std::cout << "Testing decoding fallback..." << std::endl;

        FileClassifier utf8(1024, TextEncoding::Utf8);
        FileVerdict invalid = utf8.classify(writeFile("latin.txt", "caf\xE9 au lait\n"), "latin.txt");
        assert(invalid.isIncluded());
        assert(invalid.used_fallback);
        assert(invalid.replacements == 1);
        assert(invalid.text == "caf\xEF\xBF\xBD au lait\n");

        FileClassifier latin1(1024, TextEncoding::Latin1);
        FileVerdict decoded = latin1.classify(writeFile("latin2.txt", "caf\xE9\n"), "latin2.txt");
        assert(decoded.isIncluded());
        assert(!decoded.used_fallback);
        assert(decoded.encoding == "latin-1");
        assert(decoded.text == "caf\xC3\xA9\n");

        std::cout << "✓ Decoding fallback test passed" << std::endl;
    }

    void testUnreadable() {
        std::cout << "Testing unreadable candidates..." << std::endl;

        FileClassifier classifier(1024, TextEncoding::Utf8);

        FileVerdict missing = classifier.classify(test_dir / "missing.txt", "missing.txt");
        assert(missing.status == FileStatus::SkippedUnreadable);
        assert(!missing.reason.empty());

        fs::create_directories(test_dir / "subdir");
        FileVerdict directory = classifier.classify(test_dir / "subdir", "subdir");
        assert(directory.status == FileStatus::SkippedUnreadable);
        assert(directory.reason == "not a regular file");

        // Permission bits do not stop root from opening files
        if (geteuid() != 0) {
            fs::path locked = test_dir / "locked.txt";
            std::ofstream(locked) << "private\n";
            fs::permissions(locked, fs::perms::none);
            FileVerdict unopenable = classifier.classify(locked, "locked.txt");
            fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_write);

            assert(unopenable.status == FileStatus::SkippedUnreadable);
            assert(unopenable.reason == "cannot open file");
            assert(unopenable.size_bytes == 8 && "Size comes from stat before the open");
            assert(unopenable.text.empty());
        }

        assert(getStatusName(FileStatus::SkippedBinary) == "binary");
        assert(getStatusName(FileStatus::SkippedOversize) == "oversize");

        std::cout << "✓ Unreadable test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running FileClassifier unit tests..." << std::endl;

        testIncludedText();
        testSizeBoundary();
        testBinarySniff();
        testLargeTextReadPastSniff();
        testDecodingFallback();
        testUnreadable();

        std::cout << "All FileClassifier tests passed!" << std::endl;
    }
};

int runFileClassifierTests() {
    try {
        TextDecoderTest decoder_tests;
        decoder_tests.runAllTests();

        std::cout << std::endl;

        FileClassifierTest classifier_tests;
        classifier_tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
