#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Failure categories surfaced by the git-prompts core.
 *
 * Every exception thrown by the core derives from GitPromptsError and carries
 * one of these kinds, so the protocol layer can map it to a response without
 * string matching.
 */
enum class ErrorKind {
    MissingArgument,
    InvalidArgument,
    RevisionNotFound,
    InvalidRevisionRange,
    RepositoryError,
    EncodingError,
    RepositoryUnavailable
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingArgument: return "MissingArgument";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::RevisionNotFound: return "RevisionNotFound";
        case ErrorKind::InvalidRevisionRange: return "InvalidRevisionRange";
        case ErrorKind::RepositoryError: return "RepositoryError";
        case ErrorKind::EncodingError: return "EncodingError";
        case ErrorKind::RepositoryUnavailable: return "RepositoryUnavailable";
    }
    return "Unknown";
}

class GitPromptsError : public std::runtime_error {
public:
    GitPromptsError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class MissingArgument : public GitPromptsError {
public:
    explicit MissingArgument(const std::string& message)
        : GitPromptsError(ErrorKind::MissingArgument, message) {}
};

class InvalidArgument : public GitPromptsError {
public:
    explicit InvalidArgument(const std::string& message)
        : GitPromptsError(ErrorKind::InvalidArgument, message) {}
};

class RevisionNotFound : public GitPromptsError {
public:
    explicit RevisionNotFound(const std::string& message)
        : GitPromptsError(ErrorKind::RevisionNotFound, message) {}
};

class InvalidRevisionRange : public GitPromptsError {
public:
    explicit InvalidRevisionRange(const std::string& message)
        : GitPromptsError(ErrorKind::InvalidRevisionRange, message) {}
};

class RepositoryError : public GitPromptsError {
public:
    explicit RepositoryError(const std::string& message)
        : GitPromptsError(ErrorKind::RepositoryError, message) {}
};

// Patch bytes that are not valid UTF-8. Indicates a bug upstream of the renderer.
class EncodingError : public GitPromptsError {
public:
    explicit EncodingError(const std::string& message)
        : GitPromptsError(ErrorKind::EncodingError, message) {}
};

// Raised once at startup; the server must not serve requests after it.
class RepositoryUnavailable : public GitPromptsError {
public:
    explicit RepositoryUnavailable(const std::string& message)
        : GitPromptsError(ErrorKind::RepositoryUnavailable, message) {}
};

/**
 * @brief User-visible failure of one prompt/tool operation.
 *
 * Wraps the underlying failure with the operation name and its argument.
 * kind() is the kind of the wrapped cause.
 */
class PromptError : public GitPromptsError {
public:
    PromptError(const std::string& operation, const std::string& context, const GitPromptsError& cause,
                bool isTool = false)
        : GitPromptsError(cause.kind(), buildMessage(operation, context, cause.what(), isTool)),
          operation_(operation) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;

    static std::string buildMessage(const std::string& operation, const std::string& context,
                                    const std::string& cause, bool isTool) {
        std::string msg = (isTool ? "Error running tool " : "Error generating the final prompt for ") + operation;
        if (!context.empty()) msg += " (" + context + ")";
        return msg + ": " + cause;
    }
};
