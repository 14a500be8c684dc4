#pragma once
#include <stdexcept>
#include <string>

namespace kb {

// Base for every caller-misuse error raised by the index and the clustering
// engine. None of them are retryable.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what) : std::runtime_error(what) {}
};

// add/update with text that normalizes to zero tokens
class EmptyDocumentError : public EngineError {
public:
    explicit EmptyDocumentError(const std::string& what) : EngineError(what) {}
};

// search with no usable query terms and no (empty) id filter
class EmptyQueryError : public EngineError {
public:
    explicit EmptyQueryError(const std::string& what) : EngineError(what) {}
};

// unknown document or cluster id
class NotFoundError : public EngineError {
public:
    explicit NotFoundError(const std::string& what) : EngineError(what) {}
};

class InvalidArgumentError : public EngineError {
public:
    explicit InvalidArgumentError(const std::string& what) : EngineError(what) {}
};

}
