// =================================================================
// tests/IgnorePatternTest.cpp
// =================================================================
// Unit tests for gitignore-style pattern matching.

#include "Folio/Errors.hpp"
#include "Folio/IgnorePattern.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

class IgnorePatternTest {
public:
    void testBasicMatching() {
        std::cout << "Testing IgnorePattern basic matching..." << std::endl;

        Folio::IgnorePattern pattern("*.txt");

        assert(pattern.matches("file.txt") && "Should match *.txt pattern");
        assert(!pattern.matches("file.cpp") && "Should not match non-txt files");
        assert(pattern.matches("path/to/file.txt") && "Should match in subdirectories");
        assert(!pattern.isAnchored());
        assert(pattern.getPattern() == "*.txt");

        std::cout << "✓ Basic matching test passed" << std::endl;
    }

    void testDirectoryOnlyPatterns() {
        std::cout << "Testing directory-only patterns..." << std::endl;

        Folio::IgnorePattern pattern("build/");

        assert(pattern.isDirectoryOnly());
        assert(pattern.matches("build", true) && "Should match the directory itself");
        assert(pattern.matches("project/build", true) && "Should match nested directories");
        assert(!pattern.matches("build", false) && "Should not match a file named build");
        assert(!pattern.matches("buildfile.txt") && "Should not match files starting with pattern");

        std::cout << "✓ Directory-only patterns test passed" << std::endl;
    }

    void testAnchoredPatterns() {
        std::cout << "Testing anchored patterns..." << std::endl;

        Folio::IgnorePattern leading("/config.yml");
        assert(leading.isAnchored());
        assert(leading.matches("config.yml"));
        assert(!leading.matches("sub/config.yml") && "Leading slash anchors to the base");

        Folio::IgnorePattern inner("docs/*.md");
        assert(inner.isAnchored());
        assert(inner.matches("docs/intro.md"));
        assert(!inner.matches("docs/guide/intro.md") && "* does not cross directories");
        assert(!inner.matches("other/docs/intro.md"));

        std::cout << "✓ Anchored patterns test passed" << std::endl;
    }

    void testDoubleStar() {
        std::cout << "Testing ** patterns..." << std::endl;

        Folio::IgnorePattern leading("**/logs");
        assert(leading.matches("logs"));
        assert(leading.matches("a/b/logs"));

        Folio::IgnorePattern middle("a/**/b");
        assert(middle.matches("a/b"));
        assert(middle.matches("a/x/b"));
        assert(middle.matches("a/x/y/b"));
        assert(!middle.matches("c/a/b"));

        Folio::IgnorePattern trailing("out/**");
        assert(trailing.matches("out/file"));
        assert(trailing.matches("out/deep/file"));
        assert(!trailing.matches("outside/file"));

        std::cout << "✓ ** patterns test passed" << std::endl;
    }

    void testCharacterClassesAndEscapes() {
        std::cout << "Testing character classes and escapes..." << std::endl;

        Folio::IgnorePattern range("file[0-9].log");
        assert(range.matches("file3.log"));
        assert(!range.matches("filex.log"));

        Folio::IgnorePattern negated("file[!0-9].log");
        assert(negated.matches("filex.log"));
        assert(!negated.matches("file3.log"));

        Folio::IgnorePattern question("?.tmp");
        assert(question.matches("a.tmp"));
        assert(!question.matches("ab.tmp"));

        Folio::IgnorePattern hash("\\#notes");
        assert(!hash.isEmpty() && "Escaped # is a pattern, not a comment");
        assert(hash.matches("#notes"));

        Folio::IgnorePattern bang("\\!important");
        assert(!bang.isNegation());
        assert(bang.matches("!important"));

        Folio::IgnorePattern dot("*.min.js");
        assert(dot.matches("app.min.js"));
        assert(!dot.matches("app-minxjs"));

        std::cout << "✓ Character classes and escapes test passed" << std::endl;
    }

    void testCommentsAndBlankLines() {
        std::cout << "Testing comments and blank lines..." << std::endl;

        assert(Folio::IgnorePattern("").isEmpty());
        assert(Folio::IgnorePattern("# comment").isEmpty());
        assert(Folio::IgnorePattern("/").isEmpty());

        Folio::IgnorePattern trailing_space("*.bak   ");
        assert(trailing_space.matches("x.bak"));

        std::cout << "✓ Comments and blank lines test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running IgnorePattern unit tests..." << std::endl;

        testBasicMatching();
        testDirectoryOnlyPatterns();
        testAnchoredPatterns();
        testDoubleStar();
        testCharacterClassesAndEscapes();
        testCommentsAndBlankLines();

        std::cout << "All IgnorePattern tests passed!" << std::endl;
    }
};

class IgnorePatternSetTest {
private:
    fs::path test_dir;

    void cleanup() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    IgnorePatternSetTest() : test_dir(fs::temp_directory_path() / "folio_ignore_set_test") {}

    void testLastMatchWins() {
        std::cout << "Testing last matching pattern wins..." << std::endl;

        Folio::IgnorePatternSet patterns;
        patterns.addPattern("*.log");
        patterns.addPattern("!keep.log");

        assert(patterns.shouldIgnore("debug.log"));
        assert(!patterns.shouldIgnore("keep.log") && "Negation re-includes");
        assert(patterns.evaluate("keep.log").has_value());
        assert(!patterns.evaluate("main.cpp").has_value() && "No verdict when nothing matches");

        patterns.addPattern("*.log");
        assert(patterns.shouldIgnore("keep.log") && "A later pattern overrides the negation");

        std::cout << "✓ Last match wins test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing loading an ignore file..." << std::endl;

        cleanup();
        fs::create_directories(test_dir / "project");
        std::ofstream(test_dir / "project" / ".gitignore") << "# build output\n\nbuild/\n*.o\r\n!main.o\n";

        auto patterns = Folio::IgnorePatternSet::fromFile(test_dir / "project" / ".gitignore");
        assert(patterns.size() == 3 && "Comments and blank lines are skipped");
        assert(patterns.baseDirectory() == fs::absolute(test_dir / "project").lexically_normal());
        assert(patterns.shouldIgnore("lib.o"));
        assert(!patterns.shouldIgnore("main.o"));
        assert(patterns.shouldIgnore("build", true));

        cleanup();
        std::cout << "✓ Load from file test passed" << std::endl;
    }

    void testMissingFileThrows() {
        std::cout << "Testing missing ignore file..." << std::endl;

        bool thrown = false;
        try {
            Folio::IgnorePatternSet::fromFile(test_dir / "does-not-exist" / ".gitignore");
        } catch (const Folio::ConfigError&) {
            thrown = true;
        }
        assert(thrown && "Unreadable ignore file is a configuration error");

        fs::create_directories(test_dir / "not-a-file");
        bool directory_thrown = false;
        try {
            Folio::IgnorePatternSet::fromFile(test_dir / "not-a-file");
        } catch (const Folio::ConfigError&) {
            directory_thrown = true;
        }
        assert(directory_thrown && "A directory is not an ignore file");
        cleanup();

        std::cout << "✓ Missing file test passed" << std::endl;
    }

    void testRelativeTo() {
        std::cout << "Testing paths relative to the base directory..." << std::endl;

        Folio::IgnorePatternSet patterns("/work/project");
        assert(patterns.relativeTo("/work/project/src/a.cpp").value() == "src/a.cpp");
        assert(!patterns.relativeTo("/work/other/a.cpp").has_value() && "Outside the base never matches");
        assert(!patterns.relativeTo("/work/project").has_value());

        std::cout << "✓ Relative path test passed" << std::endl;
    }

    void testStackPrecedence() {
        std::cout << "Testing ignore stack precedence..." << std::endl;

        Folio::IgnorePatternSet global("/work/project");
        global.addPattern("*.txt");

        Folio::IgnorePatternSet local("/work/project/docs");
        local.addPattern("!readme.txt");

        Folio::IgnoreStack stack;
        stack.push(global);
        assert(stack.isIgnored("/work/project/docs/readme.txt", false));

        stack.push(local);
        assert(!stack.isIgnored("/work/project/docs/readme.txt", false) && "Deeper set overrides");
        assert(stack.isIgnored("/work/project/docs/notes.txt", false));
        assert(stack.isIgnored("/work/project/readme.txt", false) && "Local set does not reach above its base");

        stack.pop();
        assert(stack.size() == 1);
        assert(stack.isIgnored("/work/project/docs/readme.txt", false));

        std::cout << "✓ Ignore stack precedence test passed" << std::endl;
    }

    void testIgnoredParents() {
        std::cout << "Testing ignored parent directories..." << std::endl;

        Folio::IgnorePatternSet global("/work/project");
        global.addPattern("generated/");

        Folio::IgnoreStack stack;
        stack.push(global);

        assert(!stack.isIgnored("/work/project/generated/a.cpp", false));
        assert(stack.isIgnoredWithParents("/work/project/generated/a.cpp", false));
        assert(!stack.isIgnoredWithParents("/work/project/src/a.cpp", false));

        std::cout << "✓ Ignored parents test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running IgnorePatternSet unit tests..." << std::endl;

        testLastMatchWins();
        testLoadFromFile();
        testMissingFileThrows();
        testRelativeTo();
        testStackPrecedence();
        testIgnoredParents();

        std::cout << "All IgnorePatternSet tests passed!" << std::endl;
    }
};

int main() {
    try {
        IgnorePatternTest pattern_tests;
        pattern_tests.runAllTests();

        std::cout << std::endl;

        IgnorePatternSetTest set_tests;
        set_tests.runAllTests();

        std::cout << "\n🎉 All IgnorePattern component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
