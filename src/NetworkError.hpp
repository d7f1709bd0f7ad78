#pragma once
#include <stdexcept>
#include <string>

enum class NetworkErrorKind
{
    UnknownNodeId,
    DuplicateNodeId,
    NegativeCost,
    SelfLink
};

class NetworkError : public std::runtime_error
{
public:
    NetworkError(NetworkErrorKind kind, const std::string &message)
        : std::runtime_error(message), errorKind(kind) {}

    NetworkErrorKind kind() const { return errorKind; }

private:
    NetworkErrorKind errorKind;
};
