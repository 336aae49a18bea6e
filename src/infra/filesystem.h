#ifndef INFRA_FILESYSTEM_H
#define INFRA_FILESYSTEM_H

#include <memory>
#include <string>

namespace infra {

// fopen-style modes accepted by IFileSystem::open.
constexpr const char *kFileRead = "r";
constexpr const char *kFileWrite = "w";

class IFile {
public:
    virtual ~IFile() = default;

    virtual bool available() = 0;
    virtual std::string readString() = 0;
    virtual std::string readStringUntil(char delimiter) = 0;
    virtual bool write(const std::string &data) = 0;
    virtual void close() = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    virtual bool exists(const char *path) const = 0;
    // Returns nullptr when the file cannot be opened in the requested mode.
    virtual std::unique_ptr<IFile> open(const char *path, const char *mode) = 0;
};

} // namespace infra

#endif // INFRA_FILESYSTEM_H
