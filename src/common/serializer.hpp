#pragma once

#include "common/cancellation.hpp"
#include "common/parse_options.hpp"
#include "common/solution_types.hpp"

namespace slnmodel {

// Abstract base class for solution file formats
class SolutionSerializer {
public:
    virtual ~SolutionSerializer() = default;

    // Open a solution file and build its model.
    // Grammar problems throw SolutionParseError, I/O problems SerializerError.
    virtual SolutionModel open(const std::string& path, const ParseOptions& options,
                               const CancellationToken& token) = 0;

    // Persist a model; failures throw SerializerError.
    // Formats with quoted text write with options.quote_char.
    virtual void save(const std::string& path, const SolutionModel& model, const ParseOptions& options) = 0;

    // Get the name of this format (e.g., "sln", "slnx")
    virtual std::string name() const = 0;

    // File extension including the dot
    virtual std::string extension() const = 0;

    // Get a description of this format
    virtual std::string description() const = 0;

    // True when the first bytes of a file look like this format
    virtual bool recognizes(const std::string& head) const = 0;
};

} // namespace slnmodel
