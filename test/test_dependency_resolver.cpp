#include <gtest/gtest.h>

#include "parsers/dependency_resolver.hpp"

using namespace slnmodel;

class DependencyResolverTest : public ::testing::Test {
protected:
    DependencyResolverTest() : diag_("test.sln", false), resolver_(diag_) {}

    static PropertyEntry entry(const std::string& key, int line) {
        PropertyEntry e;
        e.key = key;
        e.value = key;
        e.raw_value = key;
        e.line = line;
        return e;
    }

    Diagnostics diag_;
    DependencyResolver resolver_;
};

TEST_F(DependencyResolverTest, KeepsOrderAndDuplicates) {
    std::vector<PropertyEntry> entries = {
        entry("{34E0D07D-CF8F-459D-9449-C4188D8C5564}", 10),
        entry("{6DB98C35-FDCC-4818-B5D4-1F0A385FDFD4}", 11),
        entry("{34E0D07D-CF8F-459D-9449-C4188D8C5564}", 12),
    };

    std::vector<std::string> deps = resolver_.resolve_dependencies(entries);
    ASSERT_EQ(deps.size(), 3u);
    EXPECT_EQ(deps[0], "{34E0D07D-CF8F-459D-9449-C4188D8C5564}");
    EXPECT_EQ(deps[1], "{6DB98C35-FDCC-4818-B5D4-1F0A385FDFD4}");
    EXPECT_EQ(deps[2], deps[0]);
    EXPECT_TRUE(diag_.warnings().empty());
}

TEST_F(DependencyResolverTest, MalformedDependenciesAreDroppedWithWarning) {
    std::vector<PropertyEntry> entries = {
        entry("", 20),
        entry("34E0D07D-CF8F-459D-9449-C4188D8C5564", 21),
        entry("{6DB98C35-FDCC-4818-B5D4-1F0A385FDFD4}", 22),
    };

    std::vector<std::string> deps = resolver_.resolve_dependencies(entries);
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0], "{6DB98C35-FDCC-4818-B5D4-1F0A385FDFD4}");

    ASSERT_EQ(diag_.warnings().size(), 2u);
    EXPECT_EQ(diag_.warnings()[0].rfind("test.sln(20): warning:", 0), 0u);
    EXPECT_EQ(diag_.warnings()[1].rfind("test.sln(21): warning:", 0), 0u);
}

TEST_F(DependencyResolverTest, ReferencesKeepFileNames) {
    std::vector<ProjectReference> refs = resolver_.resolve_references(
        "{FD705688-88D1-4C22-9BFF-86235D89C2FC}|ClassLibrary1.dll;{F0726D09-042B-4A7A-8A01-6BED2422BD5D}|VCClassLibrary1.dll;",
        5);

    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[0].guid, "{FD705688-88D1-4C22-9BFF-86235D89C2FC}");
    EXPECT_EQ(refs[0].file_name, "ClassLibrary1.dll");
    EXPECT_EQ(refs[1].guid, "{F0726D09-042B-4A7A-8A01-6BED2422BD5D}");
    EXPECT_EQ(refs[1].file_name, "VCClassLibrary1.dll");
}

TEST_F(DependencyResolverTest, FileNamesMayContainSemicolons) {
    std::vector<ProjectReference> refs = resolver_.resolve_references(
        "{FD705688-88D1-4C22-9BFF-86235D89C2FC}|CSCla;ssLibra;ry1.dll;{F0726D09-042B-4A7A-8A01-6BED2422BD5D}|VCClassLibrary1.dll;",
        5);

    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[0].file_name, "CSCla;ssLibra;ry1.dll");
    EXPECT_EQ(refs[1].file_name, "VCClassLibrary1.dll");
    EXPECT_TRUE(diag_.warnings().empty());
}

TEST_F(DependencyResolverTest, MalformedReferencesAreDroppedWithWarning) {
    std::vector<ProjectReference> refs = resolver_.resolve_references(
        "orphan;|NoGuid.dll;NotAGuid|Bad.dll;{FD705688-88D1-4C22-9BFF-86235D89C2FC}|Good.dll", 7);

    ASSERT_EQ(refs.size(), 1u);
    EXPECT_EQ(refs[0].file_name, "Good.dll");
    EXPECT_EQ(diag_.warnings().size(), 3u);
}

TEST_F(DependencyResolverTest, EmptyValueYieldsNoReferences) {
    EXPECT_TRUE(resolver_.resolve_references("", 1).empty());
    EXPECT_TRUE(resolver_.resolve_references(";;", 1).empty());
    EXPECT_TRUE(diag_.warnings().empty());
}

TEST(DependencyResolverGuidTest, BracedGuidShape) {
    EXPECT_TRUE(DependencyResolver::is_braced_guid("{34E0D07D-CF8F-459D-9449-C4188D8C5564}"));
    EXPECT_FALSE(DependencyResolver::is_braced_guid("34E0D07D"));
    EXPECT_FALSE(DependencyResolver::is_braced_guid("{}"));
    EXPECT_FALSE(DependencyResolver::is_braced_guid("{a{b}"));
    EXPECT_FALSE(DependencyResolver::is_braced_guid("{abc"));
}
