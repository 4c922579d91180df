// =================================================================
// tests/StitchConfigTest.cpp
// =================================================================
// Unit tests for size parsing, the YAML config file and CLI overrides.

#include "ContextStitch/CliParser.hpp"
#include "ContextStitch/ConfigParser.hpp"
#include "ContextStitch/ConfigurationError.hpp"
#include "ContextStitch/StitchConfig.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>

namespace fs = std::filesystem;

using namespace ContextStitch;

namespace {

bool throwsConfigurationError(const std::function<void()>& action) {
    try {
        action();
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

} // namespace

class StitchConfigTest {
private:
    fs::path test_dir;

public:
    StitchConfigTest() : test_dir(fs::temp_directory_path() / "contextstitch_config_test") {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
        fs::create_directories(test_dir);
    }

    ~StitchConfigTest() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void testParseSize() {
        std::cout << "Testing size parsing..." << std::endl;

        const std::uintmax_t fallback = StitchConfig::kDefaultMaxFileSize;

        assert(StitchConfig::parseSize("1m", fallback) == 1048576);
        assert(StitchConfig::parseSize("500k", fallback) == 500 * 1024);
        assert(StitchConfig::parseSize("1.5m", fallback) == 1572864);
        assert(StitchConfig::parseSize("2g", fallback) == 2ULL * 1024 * 1024 * 1024);
        assert(StitchConfig::parseSize("1024", fallback) == 1024);
        assert(StitchConfig::parseSize(" 64K ", fallback) == 64 * 1024);
        assert(StitchConfig::parseSize("", fallback) == fallback);
        assert(StitchConfig::parseSize("0", fallback) == 0);

        assert(throwsConfigurationError([] { StitchConfig::parseSize("abc", 1); }));
        assert(throwsConfigurationError([] { StitchConfig::parseSize("-5k", 1); }));
        assert(throwsConfigurationError([] { StitchConfig::parseSize("1.5", 1); }));
        assert(throwsConfigurationError([] { StitchConfig::parseSize("k", 1); }));
        assert(throwsConfigurationError([] { StitchConfig::parseSize("1.2.3m", 1); }));
        assert(throwsConfigurationError([] { StitchConfig::parseSize("99999999999999999999999g", 1); }));

        std::cout << "✓ Size parsing test passed" << std::endl;
    }

    void testParseFormat() {
        std::cout << "Testing output format names..." << std::endl;

        assert(StitchConfig::parseFormat("md") == OutputFormat::Markdown);
        assert(StitchConfig::parseFormat("Markdown") == OutputFormat::Markdown);
        assert(StitchConfig::parseFormat("txt") == OutputFormat::Text);
        assert(StitchConfig::parseFormat("json") == OutputFormat::Json);
        assert(throwsConfigurationError([] { StitchConfig::parseFormat("html"); }));

        assert(StitchConfig::getFormatExtension(OutputFormat::Text) == ".txt");
        assert(StitchConfig::getFormatName(OutputFormat::Json) == "json");

        std::cout << "✓ Output format test passed" << std::endl;
    }

    void testLoadFromConfig() {
        std::cout << "Testing the YAML config file..." << std::endl;

        ConfigParser parser = ConfigParser::fromString(
            "format: txt\n"
            "max_file_size: 500k\n"
            "encoding: latin-1\n"
            "include_hidden: true\n"
            "use_gitignore: false\n"
            "preset: rust\n"
            "ignore:\n"
            "  - '*.log'\n"
            "  - '!keep.log'\n"
            "default_ignores: ['.git/']\n"
            "presets:\n"
            "  rust: [target/, '*.rlib']\n"
            "jobs: 4\n"
            "absolute_paths: yes\n"
            "colour: blue\n",
            "inline");

        StitchConfig config;
        config.loadFromConfig(parser);

        assert(config.format == OutputFormat::Text);
        assert(config.max_file_size == 500 * 1024);
        assert(config.encoding == "latin-1");
        assert(config.include_hidden);
        assert(!config.follow_symlinks && "Absent keys keep their defaults");
        assert(!config.use_gitignore);
        assert(config.preset == "rust");
        assert(config.extra_ignores.size() == 2 && config.extra_ignores[1] == "!keep.log");
        assert(config.default_ignores == std::vector<std::string>({".git/"}));
        assert(config.custom_presets.count("rust") == 1);
        assert(config.jobs == 4);
        assert(config.absolute_paths);

        assert(config.buildPresetRegistry().hasPreset("rust"));
        assert(config.getTextEncoding() == TextEncoding::Latin1);

        std::vector<std::string> unknown = parser.getUnknownKeys(StitchConfig::getKnownConfigKeys());
        assert(unknown == std::vector<std::string>({"colour"}));

        std::cout << "✓ Config file test passed" << std::endl;
    }

    void testMalformedConfig() {
        std::cout << "Testing malformed config files..." << std::endl;

        assert(throwsConfigurationError([] { ConfigParser::fromString("format: [unclosed", "bad"); }));
        assert(throwsConfigurationError([] { ConfigParser::fromString("- just\n- a list\n", "list"); }));

        assert(throwsConfigurationError([] {
            StitchConfig config;
            config.loadFromConfig(ConfigParser::fromString("include_hidden: maybe\n", "bool"));
        }));
        assert(throwsConfigurationError([] {
            StitchConfig config;
            config.loadFromConfig(ConfigParser::fromString("jobs: -2\n", "jobs"));
        }));
        assert(throwsConfigurationError([] {
            StitchConfig config;
            config.loadFromConfig(ConfigParser::fromString("ignore: {a: b}\n", "ignore"));
        }));
        assert(throwsConfigurationError([] {
            StitchConfig config;
            config.loadFromConfig(ConfigParser::fromString("max_file_size: lots\n", "size"));
        }));

        // Sequence keys are valid YAML but cannot name a setting or a preset
        assert(throwsConfigurationError([] {
            StitchConfig config;
            config.loadFromConfig(ConfigParser::fromString("? [a, b]\n: 1\nformat: md\n", "complex-key"));
        }));
        assert(throwsConfigurationError([] {
            StitchConfig config;
            config.loadFromConfig(ConfigParser::fromString("presets:\n  ? [web]\n  : ['*.map']\n", "preset-key"));
        }));

        // An empty document is an empty configuration
        StitchConfig config;
        config.loadFromConfig(ConfigParser::fromString("", "empty"));
        assert(config.format == OutputFormat::Markdown);

        assert(throwsConfigurationError([this] {
            ConfigParser parser((test_dir / "missing.yml").string());
        }));

        std::cout << "✓ Malformed config test passed" << std::endl;
    }

    void testCommandOverrides() {
        std::cout << "Testing command-line overrides..." << std::endl;

        StitchConfig config;
        config.loadFromConfig(ConfigParser::fromString(
            "format: txt\nignore: ['*.tmp']\njobs: 2\nencoding: ascii\n", "inline"));

        Commands commands;
        commands.root = test_dir.string();
        commands.format = "json";
        commands.extra_ignores = {"*.bak"};
        commands.no_gitignore = true;
        commands.max_file_size = "2m";
        commands.follow_symlinks = true;

        config.applyCommandOverrides(commands);

        assert(config.root == test_dir.string());
        assert(config.format == OutputFormat::Json);
        assert(config.extra_ignores == std::vector<std::string>({"*.tmp", "*.bak"}));
        assert(!config.use_gitignore);
        assert(config.max_file_size == 2 * 1024 * 1024);
        assert(config.follow_symlinks);
        assert(config.jobs == 2 && "Unset jobs keeps the configured value");
        assert(config.encoding == "ascii" && "Unset encoding keeps the configured value");

        std::cout << "✓ Command override test passed" << std::endl;
    }

    void testValidate() {
        std::cout << "Testing configuration validation..." << std::endl;

        StitchConfig valid;
        valid.root = test_dir.string();
        valid.validate();

        StitchConfig missing_root = valid;
        missing_root.root = (test_dir / "nope").string();
        assert(throwsConfigurationError([&] { missing_root.validate(); }));

        std::ofstream(test_dir / "file.txt") << "x";
        StitchConfig file_root = valid;
        file_root.root = (test_dir / "file.txt").string();
        assert(throwsConfigurationError([&] { file_root.validate(); }));

        StitchConfig bad_encoding = valid;
        bad_encoding.encoding = "klingon";
        assert(throwsConfigurationError([&] { bad_encoding.validate(); }));

        StitchConfig zero_jobs = valid;
        zero_jobs.jobs = 0;
        assert(throwsConfigurationError([&] { zero_jobs.validate(); }));

        StitchConfig unknown_preset = valid;
        unknown_preset.preset = "cobol";
        assert(throwsConfigurationError([&] { unknown_preset.validate(); }));

        StitchConfig custom_preset = unknown_preset;
        custom_preset.custom_presets["cobol"] = {"*.cpy"};
        custom_preset.validate();

        StitchConfig missing_gitignore = valid;
        missing_gitignore.gitignore_path = (test_dir / "absent.gitignore").string();
        assert(throwsConfigurationError([&] { missing_gitignore.validate(); }));
        missing_gitignore.use_gitignore = false;
        missing_gitignore.validate();

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running StitchConfig unit tests..." << std::endl;

        testParseSize();
        testParseFormat();
        testLoadFromConfig();
        testMalformedConfig();
        testCommandOverrides();
        testValidate();

        std::cout << "All StitchConfig tests passed!" << std::endl;
    }
};

int runStitchConfigTests() {
    try {
        StitchConfigTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
