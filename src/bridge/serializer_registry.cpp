#include "pch.h"
#include "serializer_registry.hpp"
#include "generators/sln_serializer.hpp"
#include "generators/slnx_serializer.hpp"

namespace slnmodel {

SerializerRegistry SerializerRegistry::with_defaults() {
    SerializerRegistry registry;
    registry.register_serializer(SlnSerializer::Name, []() {
        return std::make_unique<SlnSerializer>();
    });
    registry.register_serializer(SlnxSerializer::Name, []() {
        return std::make_unique<SlnxSerializer>();
    });
    return registry;
}

std::unique_ptr<SolutionSerializer> SerializerRegistry::create_for_extension(const std::string& extension) const {
    for (const auto& pair : serializers_) {
        auto serializer = pair.second();
        if (iequals(serializer->extension(), extension)) {
            return serializer;
        }
    }
    return nullptr;
}

std::unique_ptr<SolutionSerializer> SerializerRegistry::create_for_content(const std::string& head) const {
    for (const auto& pair : serializers_) {
        auto serializer = pair.second();
        if (serializer->recognizes(head)) {
            return serializer;
        }
    }
    return nullptr;
}

} // namespace slnmodel
