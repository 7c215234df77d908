#include <opencm_loaders/errors.hpp>
#include <utility>

namespace opencm_loaders {

namespace {

std::string validation_message(const std::string& source, const std::vector<std::string>& errors) {
    std::string message = "OpenCM validation failed for " + source + ":";
    for (const auto& e : errors)
        message += "\n" + e;
    return message;
}

} // namespace

FileNotFoundError::FileNotFoundError(const std::string& path)
    : LoadError("OpenCM file not found: " + path)
    , path_(path)
{
}

ModelValidationError::ModelValidationError(const std::string& source, std::vector<std::string> errors)
    : LoadError(validation_message(source, errors))
    , errors_(std::move(errors))
{
}

} // namespace opencm_loaders
