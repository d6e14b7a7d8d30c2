#pragma once

#include <curl/curl.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace ferry::util {

inline void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    // Clears per-request options but keeps the live connection cache.
    void reset() {
        curl_easy_reset(h_);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
    }

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

class SList {
public:
    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;

    void add(std::string s) {
        store_.push_back(std::move(s));
        head_ = curl_slist_append(head_, store_.back().c_str());
    }
    ~SList() { curl_slist_free_all(head_); }
    [[nodiscard]] curl_slist* get() const { return head_; }
    [[nodiscard]] bool empty() const { return head_ == nullptr; }

private:
    std::vector<std::string> store_;
    curl_slist*              head_ = nullptr;
};

inline size_t discardBody(char*, const size_t size, const size_t nmemb, void*) { return size * nmemb; }

inline size_t writeToString(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace ferry::util
