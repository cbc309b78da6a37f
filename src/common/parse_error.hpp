#pragma once

#include <stdexcept>
#include <string>

namespace slnmodel {

// Fatal structural or model-assembly error in a solution descriptor.
// what() reads "file(line): error: message".
class SolutionParseError : public std::runtime_error {
public:
    SolutionParseError(const std::string& file, int line, const std::string& message,
                       const std::string& token = "")
        : std::runtime_error(format(file, line, message, token)),
          file_(file), line_(line), message_(message), token_(token) {}

    const std::string& file() const { return file_; }
    int line() const { return line_; }
    const std::string& message() const { return message_; }
    const std::string& token() const { return token_; }

private:
    static std::string format(const std::string& file, int line, const std::string& message,
                              const std::string& token) {
        std::string result = file + "(" + std::to_string(line) + "): error: " + message;
        if (!token.empty()) {
            result += " near '" + token + "'";
        }
        return result;
    }

    std::string file_;
    int line_;
    std::string message_;
    std::string token_;
};

// Failure at the serializer/file layer (open, save, unknown format)
class SerializerError : public std::runtime_error {
public:
    SerializerError(const std::string& path, const std::string& message)
        : std::runtime_error(path + ": error: " + message), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// A bridged load or convert was cancelled by its caller
class OperationCancelledError : public std::runtime_error {
public:
    explicit OperationCancelledError(const std::string& what)
        : std::runtime_error(what + ": operation cancelled") {}
};

} // namespace slnmodel
