#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace arch_model {

// Root of the typed error taxonomy. Every operation that fails for a
// reason the caller can act on throws one of these.
class ModelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NotFoundError : public ModelError {
public:
    NotFoundError(const std::string& what, std::string id)
        : ModelError(what), id_(std::move(id)) {}
    const std::string& id() const { return id_; }

private:
    std::string id_;
};

class DuplicateError : public ModelError {
public:
    DuplicateError(const std::string& what, std::string id)
        : ModelError(what), id_(std::move(id)) {}
    const std::string& id() const { return id_; }

private:
    std::string id_;
};

// Edge (or reference) to a node that does not exist.
class ReferenceError : public ModelError {
public:
    ReferenceError(const std::string& what, std::string missing_id)
        : ModelError(what), missing_id_(std::move(missing_id)) {}
    const std::string& missing_id() const { return missing_id_; }

private:
    std::string missing_id_;
};

// Contradictory changes for one element inside one changeset.
class ConflictError : public ModelError {
public:
    ConflictError(const std::string& what, std::string element_id)
        : ModelError(what), element_id_(std::move(element_id)) {}
    const std::string& element_id() const { return element_id_; }

private:
    std::string element_id_;
};

class InvalidStateError : public ModelError {
public:
    using ModelError::ModelError;
};

class PersistenceError : public ModelError {
public:
    PersistenceError(const std::string& what, std::string path)
        : ModelError(what), path_(std::move(path)) {}
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace arch_model
