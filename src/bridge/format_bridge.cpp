#include "pch.h"
#include "format_bridge.hpp"
#include "common/path_normalizer.hpp"
#include "generators/sln_serializer.hpp"
#include "generators/slnx_serializer.hpp"

namespace fs = std::filesystem;

namespace slnmodel {

namespace {

// Enough to see an XML prolog or the .sln header line
constexpr size_t kSniffBytes = 1024;

} // namespace

std::unique_ptr<SolutionSerializer> FormatBridge::serializer_for(const std::string& path) const {
    if (auto serializer = m_registry.create_for_extension(path_extension(path))) {
        return serializer;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SerializerError(path, "cannot open solution file");
    }
    std::string head(kSniffBytes, '\0');
    file.read(&head[0], static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<size_t>(file.gcount()));

    if (auto serializer = m_registry.create_for_content(head)) {
        return serializer;
    }
    throw SerializerError(path, "unrecognized solution file format; expected " + supported_formats());
}

// "Visual Studio solution file (.sln), XML solution file (.slnx)"
std::string FormatBridge::supported_formats() const {
    std::string result;
    for (const auto& name : m_registry.available_serializers()) {
        if (!result.empty()) result += ", ";
        result += m_registry.create(name)->description();
    }
    return result;
}

std::string FormatBridge::counterpart(const std::string& format, const std::string& path) const {
    if (format == SlnSerializer::Name) return SlnxSerializer::Name;
    if (format == SlnxSerializer::Name) return SlnSerializer::Name;
    throw SerializerError(path, "no conversion target for format '" + format + "'");
}

std::string FormatBridge::detect_format(const std::string& path) const {
    return serializer_for(path)->name();
}

SolutionModel FormatBridge::load(const std::string& path, const CancellationToken& token) const {
    auto serializer = serializer_for(path);

#ifndef NDEBUG
    if (m_options.echo_warnings) {
        std::cout << "[DEBUG] Loading " << path << " as " << serializer->name() << "\n";
    }
#endif

    return serializer->open(path, m_options, token);
}

std::future<SolutionModel> FormatBridge::load_async(const std::string& path, CancellationToken token) const {
    FormatBridge self = *this;
    return std::async(std::launch::async, [self, path, token]() {
        return self.load(path, token);
    });
}

std::string FormatBridge::save_as(const SolutionModel& model, SolutionSerializer& target,
                                  const std::string& output_path, const CancellationToken& token) const {
    token.throw_if_cancelled(output_path);
    target.save(output_path, model, m_options);

    if (m_options.echo_warnings) {
        std::cout << "Converted " << model.path << " -> " << output_path << " ("
                  << model.projects.size() << " project(s))\n";
    }
    return output_path;
}

std::string FormatBridge::convert(const std::string& path, const CancellationToken& token) const {
    auto source = serializer_for(path);
    auto target = m_registry.create(counterpart(source->name(), path));
    if (!target) {
        throw SerializerError(path, "conversion target format is not registered");
    }

    // Conversion also accepts projects that would need an upgrade to load
    ParseOptions options = m_options;
    options.for_conversion = true;
    SolutionModel model = source->open(path, options, token);

    std::string output_path = fs::path(path).replace_extension(target->extension()).string();
    return save_as(model, *target, output_path, token);
}

std::string FormatBridge::convert_to(const std::string& path, const std::string& output_path,
                                     const CancellationToken& token) const {
    auto target = m_registry.create_for_extension(path_extension(output_path));
    if (!target) {
        throw SerializerError(output_path, "unrecognized solution file format; expected " + supported_formats());
    }

    ParseOptions options = m_options;
    options.for_conversion = true;
    SolutionModel model = serializer_for(path)->open(path, options, token);

    return save_as(model, *target, output_path, token);
}

} // namespace slnmodel
