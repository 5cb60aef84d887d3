#include "model/curl_model_fetcher.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <curl/curl.h>
#include <memory>

namespace {

struct Transfer {
    FILE* file = nullptr;
    uint64_t written = 0;
    const FetchOptions* options = nullptr;
    const CurlModelFetcher::ProgressCallback* progress = nullptr;
    bool cancelled = false;
    bool timed_out = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t n = std::fwrite(ptr, size, nmemb, t->file);
    t->written += n * size;
    return n * size;
}

int xferinfo_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(clientp);
    if (t->options->stop.stop_requested()) {
        t->cancelled = true;
        return 1;
    }
    if (t->options->deadline && std::chrono::steady_clock::now() >= *t->options->deadline) {
        t->timed_out = true;
        return 1;
    }
    if (*t->progress && dltotal > 0) {
        (*t->progress)(static_cast<uint64_t>(dlnow), static_cast<uint64_t>(dltotal));
    }
    return 0;
}

} // namespace

CurlModelFetcher::CurlModelFetcher(ProgressCallback progress)
    : progress_(std::move(progress)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlModelFetcher::~CurlModelFetcher() {
    curl_global_cleanup();
}

std::expected<FetchResult, FetchFailure>
CurlModelFetcher::fetch(const std::string& url, const std::filesystem::path& dest,
                        const FetchOptions& options) {
    std::unique_ptr<FILE, decltype(&std::fclose)> file(std::fopen(dest.c_str(), "wb"), &std::fclose);
    if (!file) {
        return std::unexpected(FetchFailure{
            .message = "cannot open " + dest.string() + ": " + std::strerror(errno)});
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return std::unexpected(FetchFailure{.message = "curl_easy_init failed"});
    }

    Transfer t{.file = file.get(), .options = &options, .progress = &progress_};
    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &t);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    // Stalled transfers: less than 1 KiB/s for a minute.
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, 60L);

    CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_ABORTED_BY_CALLBACK && (t.cancelled || t.timed_out)) {
        return std::unexpected(FetchFailure{
            .message = std::string("download of ") + url + (t.timed_out ? " timed out" : " cancelled"),
            .cancelled = true,
        });
    }
    if (res != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(res);
        return std::unexpected(FetchFailure{.message = "curl error: " + detail});
    }

    if (std::fflush(file.get()) != 0) {
        return std::unexpected(FetchFailure{
            .message = "write to " + dest.string() + " failed: " + std::strerror(errno)});
    }

    FetchResult result{.bytes_written = t.written};
    curl_off_t length = -1;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK &&
        length >= 0) {
        result.reported_size = static_cast<uint64_t>(length);
    }
    return result;
}
