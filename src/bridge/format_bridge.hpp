#pragma once

#include "bridge/serializer_registry.hpp"
#include "common/cancellation.hpp"
#include "common/parse_options.hpp"
#include <future>

namespace slnmodel {

// Entry point for loading and converting solutions in either format.
// Dispatches on extension first, then on the file's leading bytes.
// Each call is independent; a bridge holds no state beyond its settings.
class FormatBridge {
public:
    explicit FormatBridge(ParseOptions options = {},
                          SerializerRegistry registry = SerializerRegistry::with_defaults())
        : m_options(options), m_registry(std::move(registry)) {}

    // Load a solution in whichever format the path holds
    SolutionModel load(const std::string& path, const CancellationToken& token = {}) const;

    // Same as load(), on a worker thread; get() rethrows load()'s exceptions
    std::future<SolutionModel> load_async(const std::string& path, CancellationToken token = {}) const;

    // Write the other format next to the source (App.sln -> App.slnx); returns the new path
    std::string convert(const std::string& path, const CancellationToken& token = {}) const;

    // Write to output_path, whose extension selects the target format
    std::string convert_to(const std::string& path, const std::string& output_path,
                           const CancellationToken& token = {}) const;

    // Name of the serializer that handles a path ("sln", "slnx")
    std::string detect_format(const std::string& path) const;

    const ParseOptions& options() const { return m_options; }

private:
    std::unique_ptr<SolutionSerializer> serializer_for(const std::string& path) const;
    std::string counterpart(const std::string& format, const std::string& path) const;
    std::string supported_formats() const;
    std::string save_as(const SolutionModel& model, SolutionSerializer& target,
                        const std::string& output_path, const CancellationToken& token) const;

    ParseOptions m_options;
    SerializerRegistry m_registry;
};

} // namespace slnmodel
