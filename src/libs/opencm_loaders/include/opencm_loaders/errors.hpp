#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace opencm_loaders {

// Base of everything load_model_file() / validate_model_file() / save_model_file() throw.
class LoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FileNotFoundError : public LoadError {
public:
    explicit FileNotFoundError(const std::string& path);
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// File exists but cannot be read or written.
class IoError : public LoadError {
public:
    using LoadError::LoadError;
};

// Not JSON text, or a field of the wrong shape reached the parser.
class MalformedInputError : public LoadError {
public:
    using LoadError::LoadError;
};

// Valid JSON that breaks the format rules. Carries every violation found, in order.
class ModelValidationError : public LoadError {
public:
    ModelValidationError(const std::string& source, std::vector<std::string> errors);
    const std::vector<std::string>& errors() const { return errors_; }

private:
    std::vector<std::string> errors_;
};

} // namespace opencm_loaders
