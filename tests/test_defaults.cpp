/**
 * @file test_defaults.cpp
 * @brief Tests for the defaults merge engine
 */

#include <gtest/gtest.h>
#include "stagehand/Defaults.hpp"
#include "stagehand/Errors.hpp"
#include "stagehand/Util.hpp"
#include "test_support.hpp"

using namespace stagehand;

namespace {

/**
 * @brief defaults/, templates/ and out/ below one temp directory
 */
class DefaultsFixture : public ::testing::Test {
protected:
    TempDir root;
    fs::path defaults = root / "defaults";
    fs::path templates = root / "templates";
    fs::path output = root / "out";

    void SetUp() override {
        fs::create_directories(defaults);
        fs::create_directories(templates);
    }

    std::vector<std::string> generated(const std::string& rel) const {
        return read_lines(output / rel);
    }
};

} // anonymous namespace

// ============================================================================
// merge_lines
// ============================================================================

TEST(MergeLines, DefaultsFirstByDefault) {
    GenerateOptions options;
    EXPECT_EQ(merge_lines({"x=1", "y=2"}, {"y=3"}, options),
              (std::vector<std::string>{"x=1", "y=2", "y=3"}));
}

TEST(MergeLines, Prepend) {
    GenerateOptions options;
    options.prepend = true;
    EXPECT_EQ(merge_lines({"x=1", "y=2"}, {"y=3"}, options),
              (std::vector<std::string>{"y=3", "x=1", "y=2"}));
}

TEST(MergeLines, TrimDropsBlankLines) {
    GenerateOptions options;
    options.trim = true;
    EXPECT_EQ(merge_lines({"x=1"}, {"", "   ", "y=3"}, options),
              (std::vector<std::string>{"x=1", "y=3"}));
}

TEST(MergeLines, SortIsFlatAcrossBothHalves) {
    GenerateOptions options;
    options.sort = true;
    EXPECT_EQ(merge_lines({"m=1", "z=1"}, {"a=2", "n=2"}, options),
              (std::vector<std::string>{"a=2", "m=1", "n=2", "z=1"}));
}

TEST(JoinLines, NoTrailingSeparator) {
    EXPECT_EQ(join_lines({}), "");
    EXPECT_EQ(join_lines({"a"}), "a");
#if !defined(_WIN32)
    EXPECT_EQ(join_lines({"a", "b"}), "a\nb");
#endif
}

// ============================================================================
// read_defaults
// ============================================================================

TEST_F(DefaultsFixture, ReadDefaultsStripsExtensionAndBlankLines) {
    root.create_file("defaults/app.defaults.vtl", "x=1\n\n   \ny=2\n");
    root.create_file("defaults/sub/db.defaults.vtl", "url=jdbc\n");
    root.create_file("defaults/notes.txt", "ignored\n");

    auto entries = read_defaults(defaults);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].basename, "app");
    EXPECT_EQ(entries[0].lines, (std::vector<std::string>{"x=1", "y=2"}));
    EXPECT_EQ(entries[1].basename, "db");
    EXPECT_EQ(entries[1].relative_path, fs::path("sub") / "db.defaults.vtl");
}

TEST(ReadDefaults, MissingRootIsEmpty) {
    TempDir root;
    EXPECT_TRUE(read_defaults(root / "absent").empty());
}

// ============================================================================
// PropertiesGenerator
// ============================================================================

TEST_F(DefaultsFixture, AppendsTemplateLinesAfterDefaults) {
    root.create_file("defaults/app.defaults.vtl", "x=1\ny=2\n");
    root.create_file("templates/app.properties", "y=3\n");

    PropertiesGenerator generator(defaults, templates, output);
    auto files = generator.run();

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(generated("app.properties"), (std::vector<std::string>{"x=1", "y=2", "y=3"}));
    EXPECT_EQ(load_properties_file(output / "app.properties").at("y"), "3");
}

TEST_F(DefaultsFixture, EveryFileStartingWithBasenameIsACandidate) {
    root.create_file("defaults/app.defaults.vtl", "x=1\n");
    root.create_file("templates/app.properties", "a=1\n");
    root.create_file("templates/app-extra.properties", "b=1\n");
    root.create_file("templates/other.properties", "c=1\n");

    auto files = PropertiesGenerator(defaults, templates, output).run();

    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(generated("app-extra.properties"), (std::vector<std::string>{"x=1", "b=1"}));
    EXPECT_EQ(generated("app.properties"), (std::vector<std::string>{"x=1", "a=1"}));
    EXPECT_FALSE(fs::exists(output / "other.properties"));
}

TEST_F(DefaultsFixture, CandidatesComeFromTheMirroredDirectory) {
    root.create_file("defaults/sub/db.defaults.vtl", "pool=5\n");
    root.create_file("templates/sub/db.properties", "url=x\n");
    root.create_file("templates/db.properties", "url=top\n");

    auto files = PropertiesGenerator(defaults, templates, output).run();

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(generated("sub/db.properties"), (std::vector<std::string>{"pool=5", "url=x"}));
    EXPECT_FALSE(fs::exists(output / "db.properties"));
}

TEST_F(DefaultsFixture, EntryWithoutTemplatesGeneratesNothing) {
    root.create_file("defaults/app.defaults.vtl", "x=1\n");
    EXPECT_TRUE(PropertiesGenerator(defaults, templates, output).run().empty());
}

TEST_F(DefaultsFixture, SortTrimPrepend) {
    root.create_file("defaults/app.defaults.vtl", "z=1\na=1\n");
    root.create_file("templates/app.properties", "m=2\n\n");

    GenerateOptions options;
    options.sort = true;
    options.trim = true;
    options.prepend = true;
    PropertiesGenerator(defaults, templates, output, options).run();

    EXPECT_EQ(generated("app.properties"), (std::vector<std::string>{"a=1", "m=2", "z=1"}));
}

TEST_F(DefaultsFixture, NoDefaultsCopiesTemplates) {
    fs::remove_all(defaults);
    root.create_file("templates/app.properties", "a=1\n\n");
    root.create_file("templates/nested/other.txt", "raw");

    auto files = PropertiesGenerator(defaults, templates, output).run();

    EXPECT_EQ(files.size(), 2u);
    EXPECT_EQ(slurp(output / "app.properties"), "a=1\n\n");
    EXPECT_EQ(slurp(output / "nested" / "other.txt"), "raw");
}

TEST_F(DefaultsFixture, MissingTemplatesDirectoryIsANoOp) {
    fs::remove_all(templates);
    root.create_file("defaults/app.defaults.vtl", "x=1\n");

    EXPECT_TRUE(PropertiesGenerator(defaults, templates, output).run().empty());
    EXPECT_FALSE(fs::exists(output));
}

TEST_F(DefaultsFixture, RerunProducesIdenticalOutput) {
    root.create_file("defaults/app.defaults.vtl", "x=1\n");
    root.create_file("templates/app.properties", "y=2\n");

    merge_defaults(defaults, templates, output);
    const std::string first = slurp(output / "app.properties");
    merge_defaults(defaults, templates, output);
    EXPECT_EQ(slurp(output / "app.properties"), first);
}

// ============================================================================
// Structured mode
// ============================================================================

TEST_F(DefaultsFixture, StructuredAcceptsMatchingKeySets) {
    root.create_file("defaults/app.defaults.vtl", "x=1\n");
    root.create_file("templates/app-dev.properties", "y=dev\n");
    root.create_file("templates/app-prod.properties", "y=prod\n");

    GenerateOptions options;
    options.structured = true;
    EXPECT_EQ(PropertiesGenerator(defaults, templates, output, options).run().size(), 2u);
}

TEST_F(DefaultsFixture, StructuredReportsDisjointKeys) {
    root.create_file("defaults/app.defaults.vtl", "x=1\n");
    root.create_file("templates/app-dev.properties", "y=dev\n");
    root.create_file("templates/app-prod.properties", "z=prod\n");

    GenerateOptions options;
    options.structured = true;
    try {
        PropertiesGenerator(defaults, templates, output, options).run();
        FAIL() << "expected StructuralInconsistencyError";
    } catch (const StructuralInconsistencyError& e) {
        EXPECT_EQ(e.keys(), (std::vector<std::string>{"y", "z"}));
        EXPECT_EQ(std::string(e.what()), "Detected disjoint property sets: \n\ty\n\tz");
    }
}

TEST_F(DefaultsFixture, StructuredRejectsSupersetKeySets) {
    root.create_file("defaults/app.defaults.vtl", "x=1\n");
    root.create_file("templates/app-dev.properties", "y=dev\n");
    root.create_file("templates/app-prod.properties", "y=prod\nextra=1\n");

    GenerateOptions options;
    options.structured = true;
    EXPECT_THROW(PropertiesGenerator(defaults, templates, output, options).run(),
                 StructuralInconsistencyError);
}

TEST_F(DefaultsFixture, UnstructuredModeAllowsDisjointKeys) {
    root.create_file("defaults/app.defaults.vtl", "x=1\n");
    root.create_file("templates/app-dev.properties", "y=dev\n");
    root.create_file("templates/app-prod.properties", "z=prod\n");

    EXPECT_NO_THROW(PropertiesGenerator(defaults, templates, output).run());
}

TEST(ThrowIfNotStructured, ListsSortedKeys) {
    try {
        throw_if_not_structured({Properties{{"b", "1"}}, Properties{{"a", "1"}}});
        FAIL() << "expected StructuralInconsistencyError";
    } catch (const StructuralInconsistencyError& e) {
        EXPECT_EQ(e.keys(), (std::vector<std::string>{"a", "b"}));
    }
}
