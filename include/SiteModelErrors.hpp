#ifndef SITE_MODEL_ERRORS_HPP
#define SITE_MODEL_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace GSMP {

/**
 * @brief Base class of every fatal site model preparation error
 */
class SiteModelError : public std::runtime_error {
public:
    explicit SiteModelError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A ground-parameter or location row does not parse
 */
class MalformedRowError : public SiteModelError {
public:
    MalformedRowError(const std::string& file, std::size_t line, const std::string& reason)
        : SiteModelError(file + ":" + std::to_string(line) + ": " + reason),
          file_(file), line_(line) {}

    const std::string& file() const { return file_; }
    std::size_t line() const { return line_; }

private:
    std::string file_;
    std::size_t line_;
};

/**
 * @brief An input file could not be opened
 */
class InputFileError : public SiteModelError {
public:
    explicit InputFileError(const std::string& file)
        : SiteModelError("Cannot open input file: " + file), file_(file) {}

    const std::string& file() const { return file_; }

private:
    std::string file_;
};

/**
 * @brief No target sites could be constructed
 */
class EmptyInputError : public SiteModelError {
public:
    explicit EmptyInputError(const std::string& what) : SiteModelError(what) {}
};

/**
 * @brief The merged ground-parameter collection is empty
 */
class NoPointsAvailableError : public SiteModelError {
public:
    NoPointsAvailableError()
        : SiteModelError("No ground-parameter points available for association") {}
};

/**
 * @brief The site model could not be written; no partial file is left behind
 */
class OutputWriteError : public SiteModelError {
public:
    OutputWriteError(const std::string& path, const std::string& reason)
        : SiteModelError("Cannot write site model " + path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Invalid run configuration
 */
class ConfigurationError : public SiteModelError {
public:
    explicit ConfigurationError(const std::string& what) : SiteModelError(what) {}
};

} // namespace GSMP

#endif // SITE_MODEL_ERRORS_HPP
