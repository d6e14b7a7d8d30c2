#include "protocols/FTPClient.hpp"
#include "protocols/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>

using namespace ferry::protocols;
using namespace ferry::log;
namespace fs = std::filesystem;

namespace {

constexpr std::array<int, 3> CONNECT_BACKOFF_SECONDS = {5, 10, 15};

struct UploadContext {
    std::ifstream* in;
    uintmax_t total;
    const ProgressFn* onProgress;
    const CancelFn* shouldCancel;
};

size_t readChunk(char* buffer, const size_t size, const size_t nitems, void* userdata) {
    auto* ctx = static_cast<UploadContext*>(userdata);
    ctx->in->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (ctx->in->bad()) return CURL_READFUNC_ABORT;
    return static_cast<size_t>(ctx->in->gcount());
}

int onTransferInfo(void* userdata, curl_off_t, curl_off_t, curl_off_t, const curl_off_t ulnow) {
    const auto* ctx = static_cast<UploadContext*>(userdata);
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) return 1;
    if (ctx->onProgress && *ctx->onProgress) (*ctx->onProgress)(static_cast<uintmax_t>(ulnow), ctx->total);
    return 0;
}

// Sleeps in 100ms slices; false when cancelled.
bool interruptibleWait(const std::chrono::seconds d, const CancelFn& shouldCancel) {
    const auto deadline = std::chrono::steady_clock::now() + d;
    while (std::chrono::steady_clock::now() < deadline) {
        if (shouldCancel && shouldCancel()) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return true;
}

std::vector<std::string> splitSegments(const std::string& path) {
    std::vector<std::string> out;
    std::stringstream ss(path);
    std::string seg;
    while (std::getline(ss, seg, '/'))
        if (!seg.empty() && seg != ".") out.push_back(seg);
    return out;
}

}

FTPClient::FTPClient(config::FTPClientConfig cfg, const ClientOptions opts)
    : cfg_(std::move(cfg)), opts_(opts) {
    util::ensureCurlGlobalInit();
}

FTPClient::~FTPClient() {
    disconnect();
}

std::string FTPClient::joinRemote(const std::string& base, const std::string& rel) {
    std::string out = base.empty() ? "/" : base;
    if (out.front() != '/') out.insert(out.begin(), '/');
    for (const auto& seg : splitSegments(rel)) {
        if (out.back() != '/') out += '/';
        out += seg;
    }
    return out;
}

std::string FTPClient::remotePathFor(const fs::path& relative) const {
    return joinRemote(cfg_.remote_path, relative.generic_string());
}

std::string FTPClient::parentOf(const std::string& remote) const {
    const auto pos = remote.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return remote.substr(0, pos);
}

std::string FTPClient::url(const std::string& remotePath, const bool asDirectory) const {
    // FTPS is explicit (AUTH TLS on the plain port), so the scheme stays ftp://.
    std::string out = "ftp://" + cfg_.host + ":" + std::to_string(cfg_.port);

    for (const auto& seg : splitSegments(remotePath)) {
        char* escaped = curl_easy_escape(nullptr, seg.c_str(), static_cast<int>(seg.size()));
        if (!escaped) throw std::runtime_error("curl_easy_escape failed");
        out += "/";
        out += escaped;
        curl_free(escaped);
    }
    if (asDirectory) out += "/";
    return out;
}

void FTPClient::prepare() {
    if (!curl_) curl_ = std::make_unique<util::CurlEasy>();
    else curl_->reset();

    CURL* h = *curl_;
    errbuf_[0] = '\0';
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf_);
    curl_easy_setopt(h, CURLOPT_USERNAME, cfg_.username.c_str());
    curl_easy_setopt(h, CURLOPT_PASSWORD, cfg_.password.c_str());
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    curl_easy_setopt(h, CURLOPT_FTP_RESPONSE_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(cfg_.timeout_seconds));
    curl_easy_setopt(h, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));

    if (!cfg_.passive_mode) curl_easy_setopt(h, CURLOPT_FTPPORT, "-");

    if (cfg_.enable_tls) {
        curl_easy_setopt(h, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
        curl_easy_setopt(h, CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_DEFAULT));
    }
}

CURLcode FTPClient::perform() {
    return curl_easy_perform(*curl_);
}

long FTPClient::responseCode() {
    long code = 0;
    curl_easy_getinfo(*curl_, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

void FTPClient::fail(const CURLcode rc, const std::string& context) {
    const auto reply = responseCode();
    const auto kind = classifyCurl(rc, reply);
    std::string msg = context + ": " + (errbuf_[0] ? errbuf_ : curl_easy_strerror(rc));
    if (reply) msg += " (reply " + std::to_string(reply) + ")";
    if (kind == ErrorKind::Network || kind == ErrorKind::Auth) connected_ = false;
    throw TransferError(kind, msg);
}

void FTPClient::probeRoot() {
    prepare();
    curl_easy_setopt(*curl_, CURLOPT_URL, url("/", true).c_str());
    curl_easy_setopt(*curl_, CURLOPT_NOBODY, 1L);
    if (const auto rc = perform(); rc != CURLE_OK) fail(rc, "Cannot reach ftp://" + cfg_.host);
}

void FTPClient::connect(const CancelFn& shouldCancel) {
    std::scoped_lock lock(mutex_);
    if (cfg_.host.empty()) throw TransferError(ErrorKind::Path, "FTP host is not configured");

    const auto attempts = std::max(1u, cfg_.retry_count);
    for (unsigned int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            probeRoot();
            connected_ = true;
            Registry::protocol()->info("[FTPClient] Connected to {}:{} as {}", cfg_.host, cfg_.port, cfg_.username);
            return;
        } catch (const TransferError& e) {
            if (e.kind() == ErrorKind::Auth || attempt == attempts) {
                Registry::protocol()->error("[FTPClient] Connect failed: {} ({})", e.what(), hint(e.kind()));
                throw;
            }
            const auto wait = CONNECT_BACKOFF_SECONDS[std::min<size_t>(attempt - 1, CONNECT_BACKOFF_SECONDS.size() - 1)];
            Registry::protocol()->warn("[FTPClient] Connect attempt {}/{} failed: {}, retrying in {}s",
                                       attempt, attempts, e.what(), wait);
            if (!interruptibleWait(std::chrono::seconds(wait), shouldCancel))
                throw InterruptedError("FTP connect cancelled");
        }
    }
}

void FTPClient::disconnect() {
    std::scoped_lock lock(mutex_);
    if (curl_) {
        curl_.reset();  // cleanup sends QUIT on the cached control connection
        Registry::protocol()->debug("[FTPClient] Disconnected from {}", cfg_.host);
    }
    connected_ = false;
}

void FTPClient::uploadFile(const fs::path& local, const std::string& remote,
                           const ProgressFn& onProgress, const CancelFn& shouldCancel) {
    std::error_code ec;
    const auto total = fs::file_size(local, ec);
    if (ec) throw TransferError(classify(ec), "Cannot stat source " + local.string() + ": " + ec.message());

    std::ifstream in(local, std::ios::binary);
    if (!in) throw TransferError(ErrorKind::Path, "Cannot open source " + local.string());

    if (!isConnected()) connect(shouldCancel);

    std::scoped_lock lock(mutex_);
    prepare();

    UploadContext ctx{&in, total, &onProgress, &shouldCancel};
    CURL* h = *curl_;
    curl_easy_setopt(h, CURLOPT_URL, url(remote).c_str());
    curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(total));
    curl_easy_setopt(h, CURLOPT_READFUNCTION, readChunk);
    curl_easy_setopt(h, CURLOPT_READDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, onTransferInfo);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(h, CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY));
    if (opts_.maxBytesPerSecond > 0)
        curl_easy_setopt(h, CURLOPT_MAX_SEND_SPEED_LARGE, static_cast<curl_off_t>(opts_.maxBytesPerSecond));

    if (onProgress) onProgress(0, total);
    const auto rc = perform();
    if (rc == CURLE_ABORTED_BY_CALLBACK)
        throw InterruptedError("FTP upload of " + local.filename().string() + " interrupted");
    if (rc != CURLE_OK) fail(rc, "STOR " + remote + " failed");

    if (onProgress) onProgress(total, total);
    Registry::protocol()->debug("[FTPClient] Stored {} ({} bytes)", remote, total);
}

bool FTPClient::directoryExists(const std::string& dir) {
    prepare();
    curl_easy_setopt(*curl_, CURLOPT_URL, url(dir, true).c_str());
    curl_easy_setopt(*curl_, CURLOPT_NOBODY, 1L);
    const auto rc = perform();
    if (rc == CURLE_OK) return true;
    if (rc == CURLE_REMOTE_ACCESS_DENIED || rc == CURLE_FTP_COULDNT_RETR_FILE ||
        rc == CURLE_REMOTE_FILE_NOT_FOUND) return false;
    fail(rc, "CWD " + dir + " failed");
}

void FTPClient::ensureDirectory(const std::string& remote) {
    std::scoped_lock lock(mutex_);

    std::string current;
    for (const auto& seg : splitSegments(remote)) {
        current += "/" + seg;
        if (directoryExists(current)) continue;

        prepare();
        util::SList cmds;
        cmds.add("MKD " + current);
        curl_easy_setopt(*curl_, CURLOPT_URL, url("/", true).c_str());
        curl_easy_setopt(*curl_, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(*curl_, CURLOPT_QUOTE, cmds.get());
        const auto rc = perform();

        // 550 "already exists" races with another writer; re-check before failing.
        if (rc != CURLE_OK && !directoryExists(current)) fail(rc, "MKD " + current + " failed");
        Registry::protocol()->debug("[FTPClient] Created remote directory {}", current);
    }
}

bool FTPClient::exists(const std::string& remote) {
    std::scoped_lock lock(mutex_);
    prepare();
    curl_easy_setopt(*curl_, CURLOPT_URL, url(remote).c_str());
    curl_easy_setopt(*curl_, CURLOPT_NOBODY, 1L);
    const auto rc = perform();
    if (rc == CURLE_OK) return true;
    if (rc == CURLE_REMOTE_FILE_NOT_FOUND || rc == CURLE_FTP_COULDNT_RETR_FILE || rc == CURLE_REMOTE_ACCESS_DENIED)
        return false;
    fail(rc, "SIZE " + remote + " failed");
}

void FTPClient::remove(const std::string& remote) {
    std::scoped_lock lock(mutex_);
    prepare();
    util::SList cmds;
    cmds.add("DELE " + remote);
    curl_easy_setopt(*curl_, CURLOPT_URL, url("/", true).c_str());
    curl_easy_setopt(*curl_, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(*curl_, CURLOPT_QUOTE, cmds.get());
    if (const auto rc = perform(); rc != CURLE_OK) fail(rc, "DELE " + remote + " failed");
}

std::vector<std::string> FTPClient::listRoot() {
    std::string body;
    prepare();
    curl_easy_setopt(*curl_, CURLOPT_URL, url("/", true).c_str());
    curl_easy_setopt(*curl_, CURLOPT_DIRLISTONLY, 1L);
    curl_easy_setopt(*curl_, CURLOPT_WRITEFUNCTION, util::writeToString);
    curl_easy_setopt(*curl_, CURLOPT_WRITEDATA, &body);
    if (const auto rc = perform(); rc != CURLE_OK) fail(rc, "NLST / failed");

    std::vector<std::string> entries;
    std::istringstream ss(body);
    for (std::string line; std::getline(ss, line);) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) entries.push_back(line);
    }
    return entries;
}

std::vector<std::string> FTPClient::testConnection() {
    connect();
    std::vector<std::string> entries;
    try {
        std::scoped_lock lock(mutex_);
        entries = listRoot();
    } catch (const TransferError&) {
        disconnect();
        throw;
    }
    Registry::protocol()->info("[FTPClient] Connection test OK, {} entries in remote root", entries.size());
    disconnect();
    return entries;
}
