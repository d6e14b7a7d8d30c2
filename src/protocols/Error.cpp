#include "protocols/Error.hpp"
#include "util/files.hpp"

#include <cctype>
#include <cerrno>
#include <curl/curl.h>
#include <filesystem>

namespace ferry::protocols {

namespace {

bool containsAny(const std::string& haystack, const std::initializer_list<std::string_view> needles) {
    for (const auto n : needles)
        if (haystack.find(n) != std::string::npos) return true;
    return false;
}

// Reply codes must stand alone so "IMG_5530.jpg" is not read as a 530 reply.
bool hasReplyCode(const std::string& haystack, const std::initializer_list<std::string_view> codes) {
    for (const auto code : codes) {
        for (auto pos = haystack.find(code); pos != std::string::npos; pos = haystack.find(code, pos + 1)) {
            const bool leftOk = pos == 0 || !std::isdigit(static_cast<unsigned char>(haystack[pos - 1]));
            const auto end = pos + code.size();
            const bool rightOk = end >= haystack.size() || !std::isdigit(static_cast<unsigned char>(haystack[end]));
            if (leftOk && rightOk) return true;
        }
    }
    return false;
}

}

ErrorKind classify(const std::error_code& ec) {
    if (!ec) return ErrorKind::Unknown;
    if (ec.category() != std::generic_category() && ec.category() != std::system_category())
        return classify(ec.message());

    switch (ec.value()) {
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorKind::Permission;
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return ErrorKind::DiskFull;
        case ENOENT:
        case ENOTDIR:
        case EISDIR:
            return ErrorKind::Path;
        case ETIMEDOUT:
        case ECONNREFUSED:
        case ECONNRESET:
        case ECONNABORTED:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case ENETDOWN:
        case EHOSTDOWN:
        case EPIPE:
        case EIO:
        case ESTALE:
            return ErrorKind::Network;
        default:
            return ErrorKind::Unknown;
    }
}

ErrorKind classify(const std::string_view message) {
    const auto m = util::toLower(std::string(message));

    if (hasReplyCode(m, {"530"}) || containsAny(m, {"login incorrect", "authentication failed", "invalid credentials"}))
        return ErrorKind::Auth;
    if (hasReplyCode(m, {"421", "425"}) ||
        containsAny(m, {"connection refused", "no route to host", "timed out", "timeout",
                        "unreachable", "broken pipe", "connection reset", "network"}))
        return ErrorKind::Network;
    if (hasReplyCode(m, {"550", "553"}) || containsAny(m, {"permission denied", "access denied", "read-only file system"}))
        return ErrorKind::Permission;
    if (hasReplyCode(m, {"552"}) || containsAny(m, {"no space", "disk full", "insufficient storage", "quota"}))
        return ErrorKind::DiskFull;
    if (containsAny(m, {"file not found", "no such file", "cannot find"}))
        return ErrorKind::Path;
    return ErrorKind::Unknown;
}

ErrorKind classifyCurl(const int curlCode, const long ftpReply) {
    if (ftpReply == 530) return ErrorKind::Auth;
    if (ftpReply == 421 || ftpReply == 425 || ftpReply == 426) return ErrorKind::Network;
    if (ftpReply == 550 || ftpReply == 553) return ErrorKind::Permission;
    if (ftpReply == 452 || ftpReply == 552) return ErrorKind::DiskFull;

    switch (static_cast<CURLcode>(curlCode)) {
        case CURLE_LOGIN_DENIED:
        case CURLE_FTP_ACCEPT_FAILED:
            return ErrorKind::Auth;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_FTP_WEIRD_SERVER_REPLY:
        case CURLE_FTP_WEIRD_PASV_REPLY:
        case CURLE_FTP_CANT_GET_HOST:
        case CURLE_FTP_ACCEPT_TIMEOUT:
        case CURLE_PARTIAL_FILE:
            return ErrorKind::Network;
        case CURLE_REMOTE_ACCESS_DENIED:
        case CURLE_UPLOAD_FAILED:
            return ErrorKind::Permission;
        case CURLE_REMOTE_DISK_FULL:
            return ErrorKind::DiskFull;
        case CURLE_READ_ERROR:
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return ErrorKind::Path;
        case CURLE_ABORTED_BY_CALLBACK:
            return ErrorKind::Interrupted;
        default:
            return ErrorKind::Unknown;
    }
}

TransferError fromFilesystem(const std::exception& e, const std::string& context) {
    if (const auto* fe = dynamic_cast<const std::filesystem::filesystem_error*>(&e)) {
        const auto kind = classify(fe->code());
        return {kind == ErrorKind::Unknown ? classify(fe->what()) : kind, context + ": " + fe->what()};
    }
    if (const auto* te = dynamic_cast<const TransferError*>(&e)) return *te;
    return {classify(e.what()), context + ": " + e.what()};
}

std::string to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Path: return "path";
        case ErrorKind::Network: return "network";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Permission: return "permission";
        case ErrorKind::DiskFull: return "disk_full";
        case ErrorKind::CorruptState: return "corrupt_state";
        case ErrorKind::Interrupted: return "interrupted";
        case ErrorKind::Unknown: return "unknown";
        default: return "unknown";
    }
}

std::string hint(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Path: return "check that the source file and destination folder exist";
        case ErrorKind::Network: return "check the network connection and server address";
        case ErrorKind::Auth: return "check FTP credentials";
        case ErrorKind::Permission: return "check write permission on the destination folder";
        case ErrorKind::DiskFull: return "free up space on the destination disk";
        case ErrorKind::CorruptState: return "stale transfer state was discarded, the file restarts from zero";
        case ErrorKind::Interrupted: return "transfer will resume on the next pass";
        case ErrorKind::Unknown: return "see the log for details";
        default: return "see the log for details";
    }
}

}
