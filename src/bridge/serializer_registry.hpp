#pragma once

#include "common/serializer.hpp"
#include <functional>
#include <map>
#include <memory>

namespace slnmodel {

// Registry of solution formats a FormatBridge may dispatch to.
// Plain value type: callers build one and pass it in, there is no global instance.
class SerializerRegistry {
public:
    using SerializerCreator = std::function<std::unique_ptr<SolutionSerializer>()>;

    // Registry holding the .sln and .slnx serializers
    static SerializerRegistry with_defaults();

    // Register (or replace) a serializer
    void register_serializer(const std::string& name, SerializerCreator creator) {
        serializers_[name] = std::move(creator);
    }

    // Create a serializer by name
    std::unique_ptr<SolutionSerializer> create(const std::string& name) const {
        auto it = serializers_.find(name);
        if (it == serializers_.end()) {
            return nullptr;
        }
        return it->second();
    }

    // Create the serializer whose extension matches (case-insensitive)
    std::unique_ptr<SolutionSerializer> create_for_extension(const std::string& extension) const;

    // Create the first serializer that recognizes the file's leading bytes
    std::unique_ptr<SolutionSerializer> create_for_content(const std::string& head) const;

    // Get list of available serializer names
    std::vector<std::string> available_serializers() const {
        std::vector<std::string> names;
        for (const auto& pair : serializers_) {
            names.push_back(pair.first);
        }
        return names;
    }

    // Check if a serializer exists
    bool has_serializer(const std::string& name) const {
        return serializers_.find(name) != serializers_.end();
    }

private:
    std::map<std::string, SerializerCreator> serializers_;
};

} // namespace slnmodel
