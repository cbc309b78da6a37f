#pragma once

#include "common/serializer.hpp"

namespace slnmodel {

// The line-oriented .sln format: SlnReader in, SlnWriter out
class SlnSerializer : public SolutionSerializer {
public:
    static constexpr const char* Name = "sln";

    SolutionModel open(const std::string& path, const ParseOptions& options,
                       const CancellationToken& token) override;
    void save(const std::string& path, const SolutionModel& model, const ParseOptions& options) override;

    std::string name() const override { return Name; }
    std::string extension() const override { return ".sln"; }
    std::string description() const override { return "Visual Studio solution file (.sln)"; }
    bool recognizes(const std::string& head) const override;
};

} // namespace slnmodel
