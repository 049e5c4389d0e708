#include "profile_store.hpp"
#include <curl/curl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

namespace {

struct DownloadBuffer {
    std::string data;
    std::size_t limit;
    bool truncated;
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<DownloadBuffer*>(userp);
    size_t total_size = size * nmemb;
    if (buffer->data.size() + total_size > buffer->limit) {
        buffer->truncated = true;
        return 0; // aborts the transfer
    }
    buffer->data.append(static_cast<const char*>(contents), total_size);
    return total_size;
}

} // namespace

bool isValidStudentId(const std::string& student_id) {
    if (student_id.empty() || student_id.size() > 128 || student_id == "." || student_id == "..") {
        return false;
    }
    for (char c : student_id) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

DirectoryProfileStore::DirectoryProfileStore(const std::string& directory, std::size_t max_bytes)
    : directory(directory), max_bytes(max_bytes) {
}

ProfileImage DirectoryProfileStore::fetchReferenceImage(const std::string& student_id) const {
    if (!isValidStudentId(student_id)) {
        std::cerr << "Rejected profile lookup for malformed student id" << std::endl;
        return ProfileImage::absent();
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw ProfileStoreError("Profile directory unavailable: " + directory);
    }

    static const char* extensions[] = {".jpg", ".jpeg", ".png"};
    for (const char* extension : extensions) {
        std::filesystem::path candidate = std::filesystem::path(directory) / (student_id + extension);

        if (!std::filesystem::exists(candidate, ec)) {
            if (ec) {
                throw ProfileStoreError("Cannot access " + candidate.string() + ": " + ec.message());
            }
            continue;
        }
        if (!std::filesystem::is_regular_file(candidate, ec)) {
            std::cerr << "Profile image is not a regular file: " << candidate << std::endl;
            return ProfileImage::unusable();
        }
        auto file_size = std::filesystem::file_size(candidate, ec);
        if (ec || file_size == 0 || file_size > max_bytes) {
            std::cerr << "Profile image unusable: " << candidate << std::endl;
            return ProfileImage::unusable();
        }

        std::ifstream file(candidate, std::ios::binary);
        if (!file) {
            std::cerr << "Failed to open profile image: " << candidate << std::endl;
            return ProfileImage::unusable();
        }
        return ProfileImage::found(std::string(std::istreambuf_iterator<char>(file),
                                               std::istreambuf_iterator<char>()));
    }

    return ProfileImage::absent();
}

HttpProfileStore::HttpProfileStore(const std::string& base_url, long timeout_seconds, std::size_t max_bytes)
    : base_url(base_url), timeout_seconds(timeout_seconds), max_bytes(max_bytes) {
    while (!this->base_url.empty() && this->base_url.back() == '/') {
        this->base_url.pop_back();
    }
}

ProfileImage HttpProfileStore::fetchReferenceImage(const std::string& student_id) const {
    if (!isValidStudentId(student_id)) {
        std::cerr << "Rejected profile lookup for malformed student id" << std::endl;
        return ProfileImage::absent();
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ProfileStoreError("Failed to initialize CURL");
    }

    std::string url = base_url + "/" + student_id;
    DownloadBuffer buffer{std::string(), max_bytes, false};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "FaceVerify/1.0");

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (buffer.truncated) {
        std::cerr << "Profile image for " << student_id << " exceeds " << max_bytes << " bytes" << std::endl;
        return ProfileImage::unusable();
    }
    if (res != CURLE_OK) {
        throw ProfileStoreError(std::string("Profile fetch failed: ") + curl_easy_strerror(res));
    }
    if (http_code == 404) {
        return ProfileImage::absent();
    }
    if (http_code != 200) {
        throw ProfileStoreError("Profile fetch for " + student_id + " returned HTTP " + std::to_string(http_code));
    }
    if (buffer.data.empty()) {
        std::cerr << "Profile image for " << student_id << " is empty" << std::endl;
        return ProfileImage::unusable();
    }

    return ProfileImage::found(std::move(buffer.data));
}
