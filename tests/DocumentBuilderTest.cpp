// =================================================================
// tests/DocumentBuilderTest.cpp
// =================================================================
// Unit tests for the DocumentBuilder pipeline.

#include "Folio/DocumentBuilder.hpp"
#include "Folio/Errors.hpp"
#include "Folio/OutputAssembler.hpp"
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace fs = std::filesystem;

class DocumentBuilderTest {
private:
    fs::path test_dir;

    void setupTestFiles() {
        cleanupTestFiles();

        fs::create_directories(test_dir / ".git");
        fs::create_directories(test_dir / "lib");

        std::ofstream(test_dir / "a.py") << "x = 1  # note\nprint(x)\n";
        {
            std::ofstream bin(test_dir / "b.bin", std::ios::binary);
            bin.write("\x00\x01\x02\x03", 4);
        }
        std::ofstream(test_dir / "secrets.env") << "TOKEN=supersecret\n";
        std::ofstream(test_dir / ".git" / "HEAD") << "ref: refs/heads/main\n";
        std::ofstream(test_dir / "lib" / "util.js") << "// helper\nexport const y = 2;\n";
        std::ofstream(test_dir / "lib" / "latin1.txt") << "caf\xE9\n";
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    static const Folio::RenderedBlock* findBlock(const Folio::BuildResult& result, const std::string& path) {
        auto it = std::find_if(result.blocks.begin(), result.blocks.end(),
            [&path](const Folio::RenderedBlock& block) { return block.display_path == path; });
        return it == result.blocks.end() ? nullptr : &*it;
    }

public:
    DocumentBuilderTest() : test_dir(fs::temp_directory_path() / "folio_document_builder_test") {}

    void testScenarioDispositions() {
        std::cout << "Testing dispositions across a project..." << std::endl;

        setupTestFiles();

        Folio::RuleSet rules;
        rules.omit_dirs = {".git"};
        rules.omit_extensions = {"env"};

        Folio::DocumentBuilder builder(rules);
        auto result = builder.buildFromDirectory(test_dir);

        const auto* source = findBlock(result, "a.py");
        assert(source && source->disposition == Folio::Disposition::Rendered);
        assert(source->text() == "**a.py**\n```python\nx = 1  # note\nprint(x)\n```\n");

        const auto* binary = findBlock(result, "b.bin");
        assert(binary && binary->reason == Folio::OmitReason::Binary);

        const auto* secrets = findBlock(result, "secrets.env");
        assert(secrets && secrets->reason == Folio::OmitReason::OmittedExtension);
        assert(secrets->text().find("supersecret") == std::string::npos && "Referenced files never show content");

        const auto* latin1 = findBlock(result, "lib/latin1.txt");
        assert(latin1 && latin1->reason == Folio::OmitReason::DecodeFailed);

        for (const auto& block : result.blocks) {
            assert(block.display_path.rfind(".git/", 0) != 0 && "Nothing from .git");
        }

        assert(result.rendered == 2);
        assert(result.referenced == 3);
        assert(result.excluded == 0);
        assert(result.warnings.empty());

        cleanupTestFiles();
        std::cout << "✓ Disposition scenario test passed" << std::endl;
    }

    void testExcludedFilesProduceNoBlock() {
        std::cout << "Testing excluded files..." << std::endl;

        setupTestFiles();

        Folio::RuleSet rules;
        rules.extensions = std::vector<std::string>{"py"};
        rules.omit_dirs = {".git"};

        Folio::DocumentBuilder builder(rules);
        auto result = builder.buildFromDirectory(test_dir);

        assert(result.blocks.size() == 1);
        assert(result.blocks.front().display_path == "a.py");
        assert(result.excluded == 4);

        cleanupTestFiles();
        std::cout << "✓ Excluded files test passed" << std::endl;
    }

    void testTransformsApplied() {
        std::cout << "Testing transforms in the pipeline..." << std::endl;

        setupTestFiles();

        Folio::RuleSet rules;
        rules.omit_dirs = {".git"};
        rules.transform.strip_comments = true;

        Folio::DocumentBuilder builder(rules);
        auto result = builder.buildFromDirectory(test_dir);

        assert(findBlock(result, "a.py")->text() == "**a.py**\n```python\nx = 1\nprint(x)\n```\n");
        assert(findBlock(result, "lib/util.js")->text() ==
               "**lib/util.js**\n```javascript\n\nexport const y = 2;\n```\n");

        cleanupTestFiles();
        std::cout << "✓ Transforms test passed" << std::endl;
    }

    void testIdempotence() {
        std::cout << "Testing repeated runs..." << std::endl;

        setupTestFiles();

        Folio::RuleSet rules;
        rules.omit_dirs = {".git"};

        Folio::DocumentBuilder first(rules);
        auto first_result = first.buildFromDirectory(test_dir);
        Folio::DocumentBuilder second(rules);
        auto second_result = second.buildFromDirectory(test_dir);

        assert(Folio::assembleDocument(first_result.blocks, first_result.warnings) ==
               Folio::assembleDocument(second_result.blocks, second_result.warnings) &&
               "Two runs over an unchanged tree are byte-identical");

        cleanupTestFiles();
        std::cout << "✓ Repeated runs test passed" << std::endl;
    }

    void testInputPaths() {
        std::cout << "Testing input path lists..." << std::endl;

        setupTestFiles();
        std::ofstream(test_dir / "paths.txt")
            << (test_dir / "lib").string() << "\n"
            << "\n"
            << "  " << (test_dir / "a.py").string() << "  \n"
            << (test_dir / "missing.py").string() << "\n";

        auto paths = Folio::DocumentBuilder::readInputPaths(test_dir / "paths.txt");
        assert(paths.size() == 3 && "Blank lines are skipped");

        Folio::RuleSet rules;
        Folio::DocumentBuilder builder(rules);
        auto result = builder.buildFromPaths(paths);

        assert(findBlock(result, "lib/util.js") != nullptr && "Display paths use the common base");
        assert(findBlock(result, "a.py") != nullptr);
        assert(findBlock(result, "b.bin") == nullptr && "Only listed inputs are rendered");

        // A directory and a file inside it, plus a repeated line
        auto overlapping = builder.buildFromPaths({test_dir / "lib", test_dir / "lib" / "util.js",
                                                   test_dir / "a.py", test_dir / "a.py"});
        auto countBlocks = [&overlapping](const std::string& path) {
            return std::count_if(overlapping.blocks.begin(), overlapping.blocks.end(),
                [&path](const Folio::RenderedBlock& block) { return block.display_path == path; });
        };
        assert(countBlocks("lib/util.js") == 1 && "A file reached twice is rendered once");
        assert(countBlocks("a.py") == 1);
        assert(overlapping.blocks.size() == 3);
        assert(overlapping.rendered == 2);

        bool thrown = false;
        try {
            Folio::DocumentBuilder::readInputPaths(test_dir / "no-such-list.txt");
        } catch (const Folio::ConfigError&) {
            thrown = true;
        }
        assert(thrown);

        cleanupTestFiles();
        std::cout << "✓ Input path lists test passed" << std::endl;
    }

    void testWarningsResetBetweenBuilds() {
        std::cout << "Testing warnings across repeated builds..." << std::endl;

        if (geteuid() == 0) {
            std::cout << "✓ Skipped: permissions are not enforced for root" << std::endl;
            return;
        }

        setupTestFiles();
        fs::create_directories(test_dir / "locked");
        std::ofstream(test_dir / "locked" / "hidden.py") << "x = 1\n";
        fs::permissions(test_dir / "locked", fs::perms::none);

        Folio::RuleSet rules;
        rules.omit_dirs = {".git"};
        Folio::DocumentBuilder builder(rules);

        auto first = builder.buildFromDirectory(test_dir);
        auto second = builder.buildFromDirectory(test_dir);

        fs::permissions(test_dir / "locked", fs::perms::owner_all);

        assert(first.warnings.size() == 1);
        assert(first.warnings[0].path == "locked");
        assert(second.warnings.size() == 1 && "Earlier warnings are not repeated");
        assert(findBlock(first, "lib/util.js") != nullptr && "Siblings of the locked directory are walked");
        assert(findBlock(first, "locked/hidden.py") == nullptr);

        std::string document = Folio::assembleDocument(first.blocks, first.warnings);
        assert(document.find("> Warning: skipped directory `locked` (") != std::string::npos);
        assert(document == Folio::assembleDocument(second.blocks, second.warnings));

        cleanupTestFiles();
        std::cout << "✓ Repeated build warnings test passed" << std::endl;
    }

    void testCommonBase() {
        std::cout << "Testing common base directory..." << std::endl;

        setupTestFiles();

        fs::path base = Folio::DocumentBuilder::commonBase({test_dir / "lib" / "util.js", test_dir / "a.py"});
        assert(base == fs::absolute(test_dir).lexically_normal());

        fs::path single = Folio::DocumentBuilder::commonBase({test_dir / "lib" / "util.js"});
        assert(single == fs::absolute(test_dir / "lib").lexically_normal() && "A file counts as its directory");

        cleanupTestFiles();
        std::cout << "✓ Common base test passed" << std::endl;
    }

    void testInvalidRules() {
        std::cout << "Testing invalid rules..." << std::endl;

        Folio::RuleSet rules;
        rules.transform.max_line_length = 0;

        bool thrown = false;
        try {
            Folio::DocumentBuilder builder(rules);
        } catch (const Folio::ConfigError&) {
            thrown = true;
        }
        assert(thrown && "A zero line limit is rejected");

        std::cout << "✓ Invalid rules test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running DocumentBuilder unit tests..." << std::endl;

        testScenarioDispositions();
        testExcludedFilesProduceNoBlock();
        testTransformsApplied();
        testIdempotence();
        testInputPaths();
        testWarningsResetBetweenBuilds();
        testCommonBase();
        testInvalidRules();

        std::cout << "All DocumentBuilder tests passed!" << std::endl;
    }
};

int main() {
    try {
        DocumentBuilderTest builder_tests;
        builder_tests.runAllTests();

        std::cout << "\n🎉 All DocumentBuilder component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
