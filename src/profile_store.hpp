#ifndef PROFILE_STORE_HPP
#define PROFILE_STORE_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

// The store itself could not be consulted (transport failure, server error)
class ProfileStoreError : public std::runtime_error {
public:
    explicit ProfileStoreError(const std::string& message) : std::runtime_error(message) {}
};

// Result of a profile lookup
struct ProfileImage {
    enum class Status {
        FOUND,      // bytes holds the encoded image
        ABSENT,     // the student has no profile image
        UNUSABLE    // an image is stored but is empty, oversized or unreadable
    };

    Status status = Status::ABSENT;
    std::string bytes;

    static ProfileImage found(std::string bytes) { return ProfileImage{Status::FOUND, std::move(bytes)}; }
    static ProfileImage absent() { return ProfileImage{Status::ABSENT, std::string()}; }
    static ProfileImage unusable() { return ProfileImage{Status::UNUSABLE, std::string()}; }
};

// Resolves a student's enrolled face image to encoded bytes before verification
class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    // Throws ProfileStoreError when the store cannot answer
    virtual ProfileImage fetchReferenceImage(const std::string& student_id) const = 0;

    virtual std::string describe() const = 0;
};

// Only ids made of letters, digits, '-', '_' and '.' (but not "." or "..") are looked up
bool isValidStudentId(const std::string& student_id);

// <directory>/<student_id>.{jpg,jpeg,png}
class DirectoryProfileStore : public ProfileStore {
public:
    explicit DirectoryProfileStore(const std::string& directory, std::size_t max_bytes = 10 * 1024 * 1024);

    ProfileImage fetchReferenceImage(const std::string& student_id) const override;
    std::string describe() const override { return "directory:" + directory; }

private:
    std::string directory;
    std::size_t max_bytes;
};

// GET <base_url>/<student_id>; 404 means absent, other failures throw
class HttpProfileStore : public ProfileStore {
public:
    HttpProfileStore(const std::string& base_url, long timeout_seconds,
                     std::size_t max_bytes = 10 * 1024 * 1024);

    ProfileImage fetchReferenceImage(const std::string& student_id) const override;
    std::string describe() const override { return "http:" + base_url; }

private:
    std::string base_url;
    long timeout_seconds;
    std::size_t max_bytes;
};

#endif // PROFILE_STORE_HPP
