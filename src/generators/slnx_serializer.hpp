#pragma once

#include "common/serializer.hpp"

namespace slnmodel {

// The XML .slnx format.
//
// Reading lowers the XML into the same raw blocks the .sln grammar produces
// and runs the same model builder, so both formats share every model rule.
//
//   <Solution>
//     <Configurations><BuildType Name="Debug"/><Platform Name="Any CPU"/></Configurations>
//     <Folder Name="/Libs/" Id="{...}"><Project Path="..." Id="{...}"/></Folder>
//     <Project Path="App\App.csproj" Id="{...}" Type="fae04ec0-...">
//       <BuildDependency Project="Libs\Lib.csproj"/>
//       <BuildType Solution="Debug|Any CPU" Project="Debug"/>
//       <Platform Solution="Debug|Any CPU" Project="AnyCPU"/>
//       <Build Solution="Debug|Any CPU" Project="false"/>
//       <Properties Name="WebsiteProperties" Scope="PreLoad">
//         <Property Name="..." Value="..."/>
//       </Properties>
//     </Project>
//   </Solution>
class SlnxSerializer : public SolutionSerializer {
public:
    static constexpr const char* Name = "slnx";

    SolutionModel open(const std::string& path, const ParseOptions& options,
                       const CancellationToken& token) override;
    void save(const std::string& path, const SolutionModel& model, const ParseOptions& options) override;

    std::string name() const override { return Name; }
    std::string extension() const override { return ".slnx"; }
    std::string description() const override { return "XML solution file (.slnx)"; }
    bool recognizes(const std::string& head) const override;
};

} // namespace slnmodel
