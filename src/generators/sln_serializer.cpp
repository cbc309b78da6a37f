#include "pch.h"
#include "sln_serializer.hpp"
#include "parsers/sln_reader.hpp"
#include "sln_writer.hpp"

namespace slnmodel {

SolutionModel SlnSerializer::open(const std::string& path, const ParseOptions& options,
                                  const CancellationToken& token) {
    token.throw_if_cancelled(path);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SerializerError(path, "cannot open solution file");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    // The grammar pass itself runs to completion once started
    token.throw_if_cancelled(path);

    SlnReader reader(options);
    return reader.parse_string(buffer.str(), path);
}

void SlnSerializer::save(const std::string& path, const SolutionModel& model, const ParseOptions& options) {
    SlnWriter writer(options.quote_char);
    if (!writer.write_sln(model, path)) {
        throw SerializerError(path, "cannot write solution file");
    }
}

bool SlnSerializer::recognizes(const std::string& head) const {
    return head.find("Microsoft Visual Studio Solution File") != std::string::npos;
}

} // namespace slnmodel
