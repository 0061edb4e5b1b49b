#include "downloader.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

// Destination of one transfer; the data lands in <target>.part until complete.
struct DownloadSink {
    std::ofstream stream;
    curl_off_t received = 0;
};

size_t write_to_sink(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    const size_t bytes = size * nmemb;
    sink->stream.write(static_cast<const char*>(ptr), static_cast<std::streamsize>(bytes));
    if (!sink->stream.good()) return 0;
    sink->received += static_cast<curl_off_t>(bytes);
    return bytes;
}

int report_progress(void* label, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    if (dltotal > 0) {
        log_progress(*static_cast<const std::string*>(label), static_cast<double>(dlnow) * 100.0 / static_cast<double>(dltotal));
    }
    return 0;
}

std::string user_agent() {
    return std::string(PROGRAM_NAME) + "/" + PROGRAM_VERSION;
}

} // anonymous namespace

void download_file(const std::string& url, const fs::path& output_path, bool show_progress) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw PmsException(string_format("error.download_failed", url));
    }

    fs::path part_path = output_path;
    part_path += ".part";

    DownloadSink sink;
    sink.stream.open(part_path, std::ios::binary | std::ios::trunc);
    if (!sink.stream) {
        throw PmsException(string_format("error.create_file_failed", part_path.string()));
    }

    const std::string agent = user_agent();
    const std::string label = get_string("info.downloading");
    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_to_sink);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, 30L);

    const bool progress = show_progress && !get_quiet_mode();
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, progress ? 0L : 1L);
    if (progress) {
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, report_progress);
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &label);
    }

    const CURLcode res = curl_easy_perform(handle);
    if (progress && isatty(STDOUT_FILENO)) {
        std::cout << std::endl;
    }
    sink.stream.close();

    std::error_code ec;
    if (res != CURLE_OK) {
        fs::remove(part_path, ec);
        throw PmsException(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
    if (!sink.stream) {
        fs::remove(part_path, ec);
        throw PmsException(string_format("error.write_file_failed", part_path.string()));
    }

    fs::rename(part_path, output_path, ec);
    if (ec) {
        throw PmsException(string_format("error.copy_failed", part_path.string(), output_path.string(), ec.message()));
    }
}

void download_with_retries(const std::string& url, const fs::path& output_path, int max_retries, bool show_progress) {
    for (int attempt = 1;; ++attempt) {
        try {
            download_file(url, output_path, show_progress);
            return;
        } catch (const PmsException& e) {
            if (attempt >= max_retries) throw;
            log_warning(string_format("warning.download_retry", std::string(e.what())));
            std::this_thread::sleep_for(std::chrono::seconds(attempt));
        }
    }
}
