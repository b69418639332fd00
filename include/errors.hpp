#pragma once

#include <stdexcept>
#include <string>

namespace rag_engine {

class RagError : public std::runtime_error {
public:
    explicit RagError(const std::string& what) : std::runtime_error(what) {}
};

// Unknown index name or document id.
class NotFoundError : public RagError {
public:
    explicit NotFoundError(const std::string& what) : RagError(what) {}
};

// Caller supplied something the engine refuses to act on.
class InvalidRequestError : public RagError {
public:
    explicit InvalidRequestError(const std::string& what) : RagError(what) {}
};

// A remote dependency (vector service, embedding or completion endpoint) could not be reached.
class BackendUnavailableError : public RagError {
public:
    explicit BackendUnavailableError(const std::string& what) : RagError(what) {}
};

// Persisted or remote state could not be parsed.
class CorruptionError : public RagError {
public:
    explicit CorruptionError(const std::string& what) : RagError(what) {}
};

} // namespace rag_engine
