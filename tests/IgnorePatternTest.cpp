// =================================================================
// tests/IgnorePatternTest.cpp
// =================================================================
// Unit tests for gitignore pattern parsing and matching.

#include "ContextStitch/IgnorePattern.hpp"
#include <cassert>
#include <iostream>
#include <sstream>

using ContextStitch::IgnorePattern;
using ContextStitch::IgnorePatternSet;

class IgnorePatternTest {
public:
    void testBasicMatching() {
        std::cout << "Testing basic pattern matching..." << std::endl;

        IgnorePattern pattern("*.txt");

        assert(pattern.matches("file.txt") && "Should match *.txt pattern");
        assert(!pattern.matches("file.cpp") && "Should not match non-txt files");
        assert(pattern.matches("path/to/file.txt") && "Should match in subdirectories");
        assert(pattern.matches("./notes.txt") && "Leading ./ is ignored");
        assert(!pattern.isAnchored());

        std::cout << "✓ Basic matching test passed" << std::endl;
    }

    void testDirectoryOnly() {
        std::cout << "Testing directory-only patterns..." << std::endl;

        IgnorePattern pattern("build/");

        assert(pattern.isDirectoryOnly());
        assert(pattern.matches("build", true) && "Should match the directory itself");
        assert(pattern.matches("build/", true) && "Trailing slash on the path is accepted");
        assert(pattern.matches("project/build", true) && "Should match nested directories");
        assert(!pattern.matches("build", false) && "Should not match a file named build");
        assert(!pattern.matches("buildfile.txt") && "Should not match names starting with pattern");

        std::cout << "✓ Directory-only test passed" << std::endl;
    }

    void testNegation() {
        std::cout << "Testing negation patterns..." << std::endl;

        IgnorePattern pattern("!important.txt");

        assert(pattern.isNegation());
        assert(pattern.matches("important.txt") && "Negated rule still matches its path");
        assert(!pattern.matches("other.txt"));

        IgnorePattern escaped("\\!bang");
        assert(!escaped.isNegation() && "Escaped ! is a literal");
        assert(escaped.matches("!bang"));

        std::cout << "✓ Negation test passed" << std::endl;
    }

    void testAnchoring() {
        std::cout << "Testing anchored patterns..." << std::endl;

        IgnorePattern leading("/root.txt");
        assert(leading.isAnchored());
        assert(leading.matches("root.txt"));
        assert(!leading.matches("sub/root.txt") && "Leading slash anchors to the root");

        IgnorePattern middle("doc/frotz");
        assert(middle.isAnchored() && "A slash in the middle anchors the pattern");
        assert(middle.matches("doc/frotz"));
        assert(!middle.matches("a/doc/frotz"));

        std::cout << "✓ Anchoring test passed" << std::endl;
    }

    void testDoubleStar() {
        std::cout << "Testing ** patterns..." << std::endl;

        IgnorePattern leading("**/foo");
        assert(leading.matches("foo"));
        assert(leading.matches("a/b/foo"));
        assert(!leading.matches("foobar"));

        IgnorePattern trailing("abc/**");
        assert(trailing.matches("abc/x"));
        assert(trailing.matches("abc/x/y.txt"));
        assert(!trailing.matches("abc", true) && "Trailing /** matches contents only");

        IgnorePattern middle("a/**/b");
        assert(middle.matches("a/b"));
        assert(middle.matches("a/x/b"));
        assert(middle.matches("a/x/y/b"));
        assert(!middle.matches("a/xb"));

        std::cout << "✓ Double-star test passed" << std::endl;
    }

    void testWildcardsAndClasses() {
        std::cout << "Testing ? and character classes..." << std::endl;

        IgnorePattern question("?.c");
        assert(question.matches("a.c"));
        assert(!question.matches("ab.c"));

        IgnorePattern star("src/*.o");
        assert(star.matches("src/main.o"));
        assert(!star.matches("src/sub/main.o") && "Single star does not cross a separator");

        IgnorePattern set("[abc].txt");
        assert(set.matches("a.txt"));
        assert(!set.matches("d.txt"));

        IgnorePattern bang("[!abc].txt");
        assert(bang.matches("d.txt"));
        assert(!bang.matches("a.txt"));

        IgnorePattern caret("[^a].txt");
        assert(caret.matches("b.txt"));
        assert(!caret.matches("a.txt"));

        IgnorePattern range("*.py[cod]");
        assert(range.matches("mod.pyc"));
        assert(range.matches("pkg/mod.pyo"));
        assert(!range.matches("mod.py"));

        IgnorePattern posix("[[:digit:]]*.log");
        assert(posix.matches("1st.log"));
        assert(!posix.matches("first.log"));

        IgnorePattern escaped_dash("[a\\-z]");
        assert(escaped_dash.matches("a"));
        assert(escaped_dash.matches("-") && "Escaped dash is a literal member");
        assert(escaped_dash.matches("z"));
        assert(!escaped_dash.matches("b") && "Escaped dash does not form a range");

        IgnorePattern real_range("[a-c]");
        assert(real_range.matches("b"));
        assert(!real_range.matches("-"));

        std::cout << "✓ Wildcard and class test passed" << std::endl;
    }

    void testMalformedAndEscapes() {
        std::cout << "Testing malformed patterns and escapes..." << std::endl;

        IgnorePattern unbalanced("[abc");
        assert(!unbalanced.isEmpty());
        assert(unbalanced.matches("[abc") && "Unbalanced [ is matched literally");
        assert(!unbalanced.matches("a"));

        IgnorePattern hash("\\#notes");
        assert(!hash.isEmpty());
        assert(hash.matches("#notes"));

        IgnorePattern trailing_space("foo.txt   ");
        assert(trailing_space.matches("foo.txt") && "Unescaped trailing spaces are stripped");

        IgnorePattern escaped_space("foo\\ ");
        assert(escaped_space.matches("foo "));
        assert(!escaped_space.matches("foo"));

        IgnorePattern dot("a.b");
        assert(!dot.matches("axb") && "Regex metacharacters are literal");

        std::cout << "✓ Malformed pattern test passed" << std::endl;
    }

    void testBlankAndComments() {
        std::cout << "Testing blank lines and comments..." << std::endl;

        assert(IgnorePattern("").isEmpty());
        assert(IgnorePattern("   ").isEmpty());
        assert(IgnorePattern("# a comment").isEmpty());
        assert(IgnorePattern("\r").isEmpty());
        assert(!IgnorePattern("# a comment").matches("# a comment"));

        std::cout << "✓ Blank and comment test passed" << std::endl;
    }

    void testPatternSetLastMatchWins() {
        std::cout << "Testing pattern set precedence..." << std::endl;

        IgnorePatternSet set = IgnorePatternSet::parse({"*.log", "!keep.log"});

        assert(set.size() == 2);
        assert(set.shouldIgnore("a.log"));
        assert(!set.shouldIgnore("keep.log") && "Later negation re-includes");
        assert(set.lastMatch("keep.log") != nullptr);
        assert(set.lastMatch("keep.log")->isNegation());
        assert(set.lastMatch("readme.md") == nullptr);

        IgnorePatternSet reversed = IgnorePatternSet::parse({"!keep.log", "*.log"});
        assert(reversed.shouldIgnore("keep.log") && "Earlier negation is overridden");

        std::cout << "✓ Pattern set precedence test passed" << std::endl;
    }

    void testLoadFromStream() {
        std::cout << "Testing loading patterns from a stream..." << std::endl;

        std::istringstream input("# build output\n\nbuild/\r\n*.tmp\n  \n!keep.tmp\n");
        IgnorePatternSet set;
        size_t loaded = set.loadFromStream(input);

        assert(loaded == 3);
        assert(set.size() == 3);
        assert(set.shouldIgnore("build", true));
        assert(set.shouldIgnore("x.tmp"));
        assert(!set.shouldIgnore("keep.tmp"));

        std::cout << "✓ Stream loading test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running IgnorePattern unit tests..." << std::endl;

        testBasicMatching();
        testDirectoryOnly();
        testNegation();
        testAnchoring();
        testDoubleStar();
        testWildcardsAndClasses();
        testMalformedAndEscapes();
        testBlankAndComments();
        testPatternSetLastMatchWins();
        testLoadFromStream();

        std::cout << "All IgnorePattern tests passed!" << std::endl;
    }
};

int runIgnorePatternTests() {
    try {
        IgnorePatternTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
