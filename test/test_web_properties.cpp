#include <gtest/gtest.h>

#include "parsers/web_properties.hpp"

using namespace slnmodel;

namespace {

PropertyEntry property(const std::string& key, const std::string& value) {
    PropertyEntry e;
    e.key = key;
    e.value = value;
    e.raw_value = "\"" + value + "\"";
    return e;
}

} // namespace

TEST(WebPropertyExtractorTest, GroupsFieldsByConfiguration) {
    WebPropertyExtractor extractor;
    auto configs = extractor.extract({
        property("Debug.AspNetCompiler.VirtualPath", "/site"),
        property("Debug.AspNetCompiler.KeyContainer", "12345.container"),
        property("Release.AspNetCompiler.VirtualPath", "/site_release"),
        property("Release.AspNetCompiler.AllowPartiallyTrustedCallers", "false"),
        property("VWDPort", "8080"),
    });

    ASSERT_EQ(configs.size(), 2u);
    EXPECT_EQ(configs["Debug"].virtual_path, "/site");
    EXPECT_EQ(configs["Debug"].key_container, "12345.container");
    EXPECT_EQ(configs["Debug"].allow_partially_trusted_callers, "");
    EXPECT_EQ(configs["Release"].virtual_path, "/site_release");
    EXPECT_EQ(configs["Release"].allow_partially_trusted_callers, "false");
}

TEST(WebPropertyExtractorTest, AllElevenFieldsAreRecognized) {
    WebPropertyExtractor extractor;
    auto configs = extractor.extract({
        property("Debug.AspNetCompiler.VirtualPath", "1"),
        property("Debug.AspNetCompiler.PhysicalPath", "2"),
        property("Debug.AspNetCompiler.TargetPath", "3"),
        property("Debug.AspNetCompiler.ForceOverwrite", "4"),
        property("Debug.AspNetCompiler.Updateable", "5"),
        property("Debug.AspNetCompiler.Debug", "6"),
        property("Debug.AspNetCompiler.KeyFile", "7"),
        property("Debug.AspNetCompiler.KeyContainer", "8"),
        property("Debug.AspNetCompiler.DelaySign", "9"),
        property("Debug.AspNetCompiler.AllowPartiallyTrustedCallers", "10"),
        property("Debug.AspNetCompiler.FixedNames", "11"),
    });

    const WebCompilerParameters& p = configs.at("Debug");
    EXPECT_EQ(p.virtual_path, "1");
    EXPECT_EQ(p.physical_path, "2");
    EXPECT_EQ(p.target_path, "3");
    EXPECT_EQ(p.force_overwrite, "4");
    EXPECT_EQ(p.updateable, "5");
    EXPECT_EQ(p.debug, "6");
    EXPECT_EQ(p.key_file, "7");
    EXPECT_EQ(p.key_container, "8");
    EXPECT_EQ(p.delay_sign, "9");
    EXPECT_EQ(p.allow_partially_trusted_callers, "10");
    EXPECT_EQ(p.fixed_names, "11");
}

TEST(WebPropertyExtractorTest, UnknownDottedKeysStillCreateTheRecord) {
    WebPropertyExtractor extractor;
    auto configs = extractor.extract({
        property("Staging.AspNetCompiler.Unknown", "x"),
        property("Publish.SomethingElse", "y"),
        property(".AspNetCompiler.VirtualPath", "z"),
    });

    ASSERT_EQ(configs.size(), 2u);
    ASSERT_TRUE(configs.count("Staging"));
    EXPECT_EQ(configs["Staging"].virtual_path, "");
    EXPECT_TRUE(configs.count("Publish"));
}

TEST(WebPropertyExtractorTest, TargetFrameworkMonikerIsUnescaped) {
    WebPropertyExtractor extractor;
    EXPECT_EQ(extractor.target_framework_moniker({property("TargetFrameworkMoniker", ".NETFramework,Version%3Dv4.0")}),
              ".NETFramework,Version=v4.0");
    EXPECT_EQ(extractor.target_framework_moniker({property("VWDPort", "8080")}), "");
}

TEST(WebPropertyExtractorTest, MalformedEscapesAreLeftAsWritten) {
    EXPECT_EQ(WebPropertyExtractor::unescape("100%"), "100%");
    EXPECT_EQ(WebPropertyExtractor::unescape("%ZZabc"), "%ZZabc");
    EXPECT_EQ(WebPropertyExtractor::unescape("a%20b%2c"), "a b,");
}
