#ifndef INFRA_POSIX_FILESYSTEM_H
#define INFRA_POSIX_FILESYSTEM_H

#include "filesystem.h"
#include <cstdio>

namespace infra {

class PosixFile : public IFile {
public:
    explicit PosixFile(std::FILE *file);
    ~PosixFile() override;

    PosixFile(const PosixFile &) = delete;
    PosixFile &operator=(const PosixFile &) = delete;

    bool available() override;
    std::string readString() override;
    std::string readStringUntil(char delimiter) override;
    bool write(const std::string &data) override;
    void close() override;

private:
    std::FILE *m_file;
};

class PosixFileSystem : public IFileSystem {
public:
    PosixFileSystem() = default;
    ~PosixFileSystem() override = default;

    bool exists(const char *path) const override;
    std::unique_ptr<IFile> open(const char *path, const char *mode) override;
};

} // namespace infra

#endif // INFRA_POSIX_FILESYSTEM_H
