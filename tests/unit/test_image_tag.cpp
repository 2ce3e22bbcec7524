#include <gtest/gtest.h>
#include "image_tag.h"
#include <algorithm>
#include <cctype>

using namespace kiln;

// Test ImageDefinition hashing and tag derivation
class ImageTagTest : public ::testing::Test {
protected:
    // Helper to create a basic compiler definition
    ImageDefinition create_python() {
        ImageDefinition def;
        def.compiler_id = "python-3.11";
        def.dockerfile_content = "FROM python:3.11-slim\n";
        def.run_command = {"python", "-"};
        return def;
    }
};

// ============================================================================
// Hash Calculation Tests
// ============================================================================

TEST_F(ImageTagTest, CalculateHash_ReturnsValidSHA256) {
    // Given: A basic definition
    ImageDefinition def = create_python();

    // When: Calculating hash
    std::string hash = def.calculate_hash();

    // Then: Should return valid SHA256 (64 hex characters)
    EXPECT_EQ(hash.length(), 64u) << "SHA256 hash should be 64 characters";
    EXPECT_TRUE(std::all_of(hash.begin(), hash.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c));
    })) << "Hash should only contain hexadecimal characters";
}

TEST_F(ImageTagTest, CalculateHash_IdenticalDefinitionsMatch) {
    // Given: Two identical definitions
    // When: Calculating hashes
    // Then: Should produce identical hashes
    EXPECT_EQ(create_python().calculate_hash(), create_python().calculate_hash())
        << "Identical definitions should produce identical hashes";
}

TEST_F(ImageTagTest, CalculateHash_EveryFieldMatters) {
    // Given: A base definition and one variant per field
    ImageDefinition base = create_python();

    ImageDefinition other_id = base;
    other_id.compiler_id = "python-3.12";

    ImageDefinition other_dockerfile = base;
    other_dockerfile.dockerfile_content += "RUN pip install numpy\n";

    ImageDefinition other_command = base;
    other_command.run_command = {"python3", "-"};

    // Then: Each edit changes the hash
    EXPECT_NE(base.calculate_hash(), other_id.calculate_hash()) << "Compiler id should affect hash";
    EXPECT_NE(base.calculate_hash(), other_dockerfile.calculate_hash()) << "Dockerfile should affect hash";
    EXPECT_NE(base.calculate_hash(), other_command.calculate_hash()) << "Run command should affect hash";
}

TEST_F(ImageTagTest, CalculateHash_FieldBoundariesAreUnambiguous) {
    // Given: Definitions whose concatenated fields would be identical
    ImageDefinition a = create_python();
    a.run_command = {"ab", "c"};

    ImageDefinition b = create_python();
    b.run_command = {"a", "bc"};

    ImageDefinition c = create_python();
    c.run_command = {"abc"};

    // Then: Length prefixes keep them apart
    EXPECT_NE(a.calculate_hash(), b.calculate_hash());
    EXPECT_NE(a.calculate_hash(), c.calculate_hash());
    EXPECT_NE(b.calculate_hash(), c.calculate_hash());
}

TEST_F(ImageTagTest, CalculateHash_EmptyArgumentsCount) {
    // Given: A command with and without a trailing empty argument
    ImageDefinition a = create_python();
    ImageDefinition b = create_python();
    b.run_command.push_back("");

    // Then: The argument count is part of the hash
    EXPECT_NE(a.calculate_hash(), b.calculate_hash());
}

TEST_F(ImageTagTest, FromCompiler_CopiesBuildInputsOnly) {
    // Given: Two compiler records that differ only in runtime policy
    Compiler first;
    first.id = "python-3.11";
    first.dockerfile_content = "FROM python:3.11-slim\n";
    first.run_command = {"python", "-"};
    first.timeout_seconds = 10;

    Compiler second = first;
    second.timeout_seconds = 30;
    second.memory_limit = "1g";
    second.enabled = false;

    // Then: Policy changes don't invalidate the image
    EXPECT_EQ(ImageDefinition::from_compiler(first).image_tag("kiln"),
              ImageDefinition::from_compiler(second).image_tag("kiln"));
}

// ============================================================================
// Tag Format Tests
// ============================================================================

TEST_F(ImageTagTest, ImageTag_Format) {
    // Given: A definition
    ImageDefinition def = create_python();

    // When: Deriving its tag
    std::string tag = def.image_tag("kiln");

    // Then: "<prefix>-<id>:<16 hex chars of the hash>"
    EXPECT_EQ(tag, "kiln-python-3.11:" + def.calculate_hash().substr(0, 16));
}

TEST_F(ImageTagTest, StagingTag_DistinctFromFinalTag) {
    ImageDefinition def = create_python();

    std::string final_tag = def.image_tag("kiln");
    std::string staging1 = def.staging_tag("kiln", 1);
    std::string staging2 = def.staging_tag("kiln", 2);

    EXPECT_NE(staging1, final_tag);
    EXPECT_NE(staging1, staging2) << "Each build attempt gets its own staging tag";
    EXPECT_EQ(staging1.rfind("kiln-python-3.11:staging-", 0), 0u);
}

// ============================================================================
// Repository Name Sanitization Tests
// ============================================================================

TEST_F(ImageTagTest, Sanitize_LowercasesAndReplacesInvalidCharacters) {
    EXPECT_EQ(sanitize_repository_name("Python_3.11"), "python-3.11");
    EXPECT_EQ(sanitize_repository_name("GCC 13 (C++20)"), "gcc-13-c-20");
    EXPECT_EQ(sanitize_repository_name("node/20"), "node-20");
}

TEST_F(ImageTagTest, Sanitize_CollapsesAndTrimsSeparators) {
    EXPECT_EQ(sanitize_repository_name("a..b"), "a.b");
    EXPECT_EQ(sanitize_repository_name("a--b"), "a-b");
    EXPECT_EQ(sanitize_repository_name("trailing---"), "trailing");
    EXPECT_EQ(sanitize_repository_name("__leading"), "leading");
}

TEST_F(ImageTagTest, Sanitize_EmptyFallsBack) {
    EXPECT_EQ(sanitize_repository_name(""), "unnamed");
    EXPECT_EQ(sanitize_repository_name("!!!"), "unnamed");
}
