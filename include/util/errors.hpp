#pragma once
#include <stdexcept>
#include <string>

namespace ncbridge
{

enum class ErrorKind
{
    InvalidArgument,      // unrecognized selector / malformed request, never retried
    ProviderCallFailure,  // provider rejected a synchronous operation
};

inline const char *error_kind_name(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::InvalidArgument:
            return "invalid_argument";
        case ErrorKind::ProviderCallFailure:
            return "provider_failure";
    }
    return "unknown";
}

// Raised synchronously to the caller of a bridge operation.
class BridgeError : public std::runtime_error
{
  public:
    BridgeError(ErrorKind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

}  // namespace ncbridge
