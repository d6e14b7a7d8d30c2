#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::protocols {

enum class ErrorKind {
    Path,          // missing or uncreatable directory, vanished source
    Network,       // timeout, refused, unreachable
    Auth,          // login rejected
    Permission,
    DiskFull,      // quota or free space exhausted on the destination
    CorruptState,  // resume/dedup record inconsistent
    Interrupted,   // pause or stop reached mid-transfer, not a failure
    Unknown
};

class TransferError : public std::runtime_error {
public:
    TransferError(const ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }

    [[nodiscard]] bool interrupted() const { return kind_ == ErrorKind::Interrupted; }

private:
    ErrorKind kind_;
};

struct PathError : TransferError {
    explicit PathError(const std::string& what) : TransferError(ErrorKind::Path, what) {}
};

struct InterruptedError : TransferError {
    explicit InterruptedError(const std::string& what = "transfer interrupted")
        : TransferError(ErrorKind::Interrupted, what) {}
};

ErrorKind classify(const std::error_code& ec);

// Free-text classifier for server replies and library messages. Reply codes
// are matched as substrings ("530 Login incorrect").
ErrorKind classify(std::string_view message);

// libcurl result plus the last FTP reply code (0 when none was received).
ErrorKind classifyCurl(int curlCode, long ftpReply);

// Wraps a filesystem failure with its kind and the operation's context.
TransferError fromFilesystem(const std::exception& e, const std::string& context);

std::string to_string(ErrorKind kind);

// Short operator-facing remedy for a failure of the given kind.
std::string hint(ErrorKind kind);

}
