#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <future>
#include <set>
#include <sstream>

#include "bridge/format_bridge.hpp"
#include "generators/sln_serializer.hpp"
#include "parsers/dependency_resolver.hpp"
#include "test_solutions.hpp"

using namespace slnmodel;
using test_data::expect_equivalent;
using test_data::parse_quiet;

namespace fs = std::filesystem;

namespace {

// Serves a fixed model for any path ending in .fake
class FakeSerializer : public SolutionSerializer {
public:
    SolutionModel open(const std::string& path, const ParseOptions&, const CancellationToken& token) override {
        token.throw_if_cancelled(path);
        SolutionModel model = parse_quiet(test_data::kBasicSolution);
        model.path = path;
        return model;
    }

    void save(const std::string& path, const SolutionModel&, const ParseOptions&) override {
        throw SerializerError(path, "read-only format");
    }

    std::string name() const override { return "fake"; }
    std::string extension() const override { return ".fake"; }
    std::string description() const override { return "Fixed test model"; }
    bool recognizes(const std::string& head) const override { return head.rfind("FAKE", 0) == 0; }
};

ParseOptions quiet_options() {
    ParseOptions options;
    options.echo_warnings = false;
    return options;
}

const std::string kLegacyVcprojSolution = R"(Microsoft Visual Studio Solution File, Format Version 10.00
Project("{8BC9CEB8-8B4A-11D0-8D11-00A0C91BC942}") = "Old", "Old\Old.vcproj", "{11111111-1111-1111-1111-111111111111}"
EndProject
)";

} // namespace

class FormatBridgeTest : public ::testing::Test {
protected:
    FormatBridgeTest() : bridge_(quiet_options()) {}

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = fs::temp_directory_path() / (std::string("format_bridge_test_") + info->name());
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        fs::remove_all(temp_dir_);
    }

    std::string write_temp_file(const std::string& filename, const std::string& content) {
        fs::path file_path = temp_dir_ / filename;
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        return file_path.string();
    }

    fs::path temp_dir_;
    FormatBridge bridge_;
};

TEST_F(FormatBridgeTest, DetectsFormatByExtension) {
    // The file does not need to exist when the extension decides
    EXPECT_EQ(bridge_.detect_format((temp_dir_ / "App.sln").string()), "sln");
    EXPECT_EQ(bridge_.detect_format((temp_dir_ / "App.SLNX").string()), "slnx");
}

TEST_F(FormatBridgeTest, DetectsFormatByContent) {
    EXPECT_EQ(bridge_.detect_format(write_temp_file("legacy.txt", test_data::kBasicSolution)), "sln");
    EXPECT_EQ(bridge_.detect_format(write_temp_file("structured.xml",
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<Solution />\n")), "slnx");

    EXPECT_THROW(bridge_.detect_format(write_temp_file("notes.txt", "just some text")), SerializerError);
    EXPECT_THROW(bridge_.detect_format((temp_dir_ / "absent.txt").string()), SerializerError);
}

TEST_F(FormatBridgeTest, LoadsEitherFormat) {
    std::string sln = write_temp_file("App.sln", test_data::kFolderSolution);
    SolutionModel legacy = bridge_.load(sln);
    EXPECT_EQ(legacy.path, sln);
    EXPECT_EQ(legacy.projects.size(), 5u);

    std::string slnx = (temp_dir_ / "Copy.slnx").string();
    EXPECT_EQ(bridge_.convert_to(sln, slnx), slnx);
    SolutionModel structured = bridge_.load(slnx);
    expect_equivalent(legacy, structured);
}

TEST_F(FormatBridgeTest, LoadReportsMissingFile) {
    try {
        bridge_.load((temp_dir_ / "missing.sln").string());
        FAIL() << "expected SerializerError";
    } catch (const SerializerError& e) {
        EXPECT_EQ(e.path(), (temp_dir_ / "missing.sln").string());
    }
}

TEST_F(FormatBridgeTest, ConvertWritesCounterpartBesideSource) {
    std::string sln = write_temp_file("Web.sln", test_data::kWebSolution);

    std::string slnx = bridge_.convert(sln);
    EXPECT_EQ(slnx, (temp_dir_ / "Web.slnx").string());
    ASSERT_TRUE(fs::exists(slnx));
    EXPECT_EQ(bridge_.detect_format(slnx), "slnx");

    // And back again under a different name
    std::string back = bridge_.convert_to(slnx, (temp_dir_ / "Back.sln").string());
    expect_equivalent(bridge_.load(sln), bridge_.load(back));
}

TEST_F(FormatBridgeTest, ConvertAcceptsProjectsThatNeedUpgrade) {
    std::string sln = write_temp_file("Legacy.sln", kLegacyVcprojSolution);

    EXPECT_THROW(bridge_.load(sln), SolutionParseError);

    std::string slnx = bridge_.convert(sln);
    ParseOptions options = quiet_options();
    options.for_conversion = true;
    FormatBridge lenient(options);
    SolutionModel model = lenient.load(slnx);
    ASSERT_EQ(model.projects.size(), 1u);
    EXPECT_EQ(model.projects[0].relative_path, "Old\\Old.vcproj");
}

TEST_F(FormatBridgeTest, ConvertToUnknownExtensionFails) {
    std::string sln = write_temp_file("App.sln", test_data::kBasicSolution);
    EXPECT_THROW(bridge_.convert_to(sln, (temp_dir_ / "App.txt").string()), SerializerError);
}

TEST_F(FormatBridgeTest, ParseErrorsPassThrough) {
    std::string sln = write_temp_file("Broken.sln",
        "Microsoft Visual Studio Solution File, Format Version 12.00\nGlobal\n");
    try {
        bridge_.load(sln);
        FAIL() << "expected SolutionParseError";
    } catch (const SolutionParseError& e) {
        EXPECT_EQ(e.file(), sln);
        EXPECT_EQ(e.line(), 2);
    }
}

TEST_F(FormatBridgeTest, CancelledOperationsLeaveNoOutput) {
    std::string sln = write_temp_file("App.sln", test_data::kBasicSolution);

    CancellationSource source;
    EXPECT_FALSE(source.token().cancelled());
    source.cancel();

    EXPECT_THROW(bridge_.load(sln, source.token()), OperationCancelledError);
    EXPECT_THROW(bridge_.convert(sln, source.token()), OperationCancelledError);
    EXPECT_FALSE(fs::exists(temp_dir_ / "App.slnx"));
}

TEST_F(FormatBridgeTest, LoadAsyncDeliversModelOrError) {
    std::string sln = write_temp_file("App.sln", test_data::kBasicSolution);

    std::future<SolutionModel> ok = bridge_.load_async(sln);
    std::future<SolutionModel> missing = bridge_.load_async((temp_dir_ / "missing.sln").string());

    SolutionModel model = ok.get();
    EXPECT_EQ(model.projects.size(), 4u);
    EXPECT_THROW(missing.get(), SerializerError);
}

TEST_F(FormatBridgeTest, LoadAsyncHonorsCancellation) {
    std::string sln = write_temp_file("App.sln", test_data::kBasicSolution);

    CancellationSource source;
    source.cancel();
    std::future<SolutionModel> result = bridge_.load_async(sln, source.token());
    EXPECT_THROW(result.get(), OperationCancelledError);
}

TEST_F(FormatBridgeTest, ConcurrentLoadsAreIndependent) {
    // Folders without an Id get generated identifiers
    const std::string slnx = R"(<Solution>
  <Folder Name="/src/libs/">
    <Project Path="src/Lib/Lib.csproj" />
  </Folder>
  <Folder Name="/tools/">
    <Project Path="tools/Gen/Gen.csproj" />
  </Folder>
</Solution>
)";
    std::string first_path = write_temp_file("First.slnx", slnx);
    std::string second_path = write_temp_file("Second.slnx", slnx);

    std::vector<std::future<SolutionModel>> pending;
    for (int i = 0; i < 8; ++i) {
        pending.push_back(bridge_.load_async(i % 2 == 0 ? first_path : second_path));
    }

    std::set<std::string> guids;
    for (auto& result : pending) {
        SolutionModel model = result.get();
        ASSERT_EQ(model.projects.size(), 5u);
        for (const auto& entry : model.projects) {
            EXPECT_TRUE(DependencyResolver::is_braced_guid(entry.guid)) << entry.guid;
            guids.insert(to_upper(entry.guid));
        }
        const ProjectEntry* lib = model.find_project_by_unique_name("src\\libs\\Lib");
        ASSERT_NE(lib, nullptr);
        EXPECT_EQ(lib->name, "Lib");
    }
    EXPECT_EQ(guids.size(), 8u * 5u);
}

TEST_F(FormatBridgeTest, UnrecognizedFormatNamesSupportedFormats) {
    try {
        bridge_.detect_format(write_temp_file("notes.txt", "just some text"));
        FAIL() << "expected SerializerError";
    } catch (const SerializerError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("Visual Studio solution file (.sln)"), std::string::npos) << message;
        EXPECT_NE(message.find("XML solution file (.slnx)"), std::string::npos) << message;
    }
}

TEST_F(FormatBridgeTest, SaveUsesConfiguredQuoteCharacter) {
    ParseOptions options = quiet_options();
    options.quote_char = '\'';
    SolutionModel model = parse_quiet(test_data::kBasicSolution);

    std::string path = (temp_dir_ / "Quoted.sln").string();
    SlnSerializer serializer;
    serializer.save(path, model, options);

    std::ifstream file(path, std::ios::binary);
    std::stringstream text;
    text << file.rdbuf();
    EXPECT_NE(text.str().find("Project('{F184B08F-C81C-45F6-A57F-5ABD9991F28F}')"), std::string::npos);

    SolutionModel loaded = FormatBridge(options).load(path);
    expect_equivalent(model, loaded);
}

TEST_F(FormatBridgeTest, CustomRegistryControlsDispatch) {
    SerializerRegistry registry;
    registry.register_serializer(SlnSerializer::Name, []() {
        return std::make_unique<SlnSerializer>();
    });
    registry.register_serializer("fake", []() {
        return std::make_unique<FakeSerializer>();
    });

    EXPECT_TRUE(registry.has_serializer("fake"));
    EXPECT_FALSE(registry.has_serializer("slnx"));
    EXPECT_EQ(registry.available_serializers(), (std::vector<std::string>{"fake", "sln"}));
    EXPECT_FALSE(registry.create("slnx"));

    FormatBridge bridge(quiet_options(), std::move(registry));

    SolutionModel model = bridge.load((temp_dir_ / "anything.fake").string());
    EXPECT_EQ(model.projects.size(), 4u);
    EXPECT_EQ(bridge.detect_format(write_temp_file("sniffed.bin", "FAKE solution")), "fake");

    // The counterpart of .sln is not registered here
    std::string sln = write_temp_file("App.sln", test_data::kBasicSolution);
    EXPECT_THROW(bridge.convert(sln), SerializerError);
    EXPECT_THROW(bridge.convert((temp_dir_ / "anything.fake").string()), SerializerError);
}

TEST(SerializerRegistryTest, DefaultsHoldBothFormats) {
    SerializerRegistry registry = SerializerRegistry::with_defaults();
    EXPECT_EQ(registry.available_serializers(), (std::vector<std::string>{"sln", "slnx"}));

    auto by_extension = registry.create_for_extension(".SLN");
    ASSERT_TRUE(by_extension);
    EXPECT_EQ(by_extension->name(), "sln");

    auto by_content = registry.create_for_content("\xEF\xBB\xBF\nMicrosoft Visual Studio Solution File, Format Version 12.00");
    ASSERT_TRUE(by_content);
    EXPECT_EQ(by_content->name(), "sln");

    EXPECT_FALSE(registry.create_for_extension(".csproj"));
    EXPECT_FALSE(registry.create_for_content("random bytes"));
}
