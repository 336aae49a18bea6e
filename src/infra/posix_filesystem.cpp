#include "posix_filesystem.h"
#include <sys/stat.h>

namespace infra {

PosixFile::PosixFile(std::FILE *file)
    : m_file(file)
{
}

PosixFile::~PosixFile() {
    close();
}

bool PosixFile::available() {
    if (!m_file) {
        return false;
    }
    int c = std::fgetc(m_file);
    if (c == EOF) {
        return false;
    }
    std::ungetc(c, m_file);
    return true;
}

std::string PosixFile::readString() {
    std::string out;
    if (!m_file) {
        return out;
    }
    char buffer[1024];
    size_t n;
    while ((n = std::fread(buffer, 1, sizeof(buffer), m_file)) > 0) {
        out.append(buffer, n);
    }
    return out;
}

std::string PosixFile::readStringUntil(char delimiter) {
    std::string out;
    if (!m_file) {
        return out;
    }
    int c;
    while ((c = std::fgetc(m_file)) != EOF) {
        if (static_cast<char>(c) == delimiter) {
            break;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

bool PosixFile::write(const std::string &data) {
    if (!m_file) {
        return false;
    }
    if (data.empty()) {
        return true;
    }
    return std::fwrite(data.data(), 1, data.size(), m_file) == data.size();
}

void PosixFile::close() {
    if (m_file) {
        std::fclose(m_file);
        m_file = nullptr;
    }
}

bool PosixFileSystem::exists(const char *path) const {
    if (!path) {
        return false;
    }
    struct stat st;
    return ::stat(path, &st) == 0 && S_ISREG(st.st_mode);
}

std::unique_ptr<IFile> PosixFileSystem::open(const char *path, const char *mode) {
    if (!path || !mode) {
        return nullptr;
    }
    std::FILE *file = std::fopen(path, mode);
    if (!file) {
        return nullptr;
    }
    return std::unique_ptr<IFile>(new PosixFile(file));
}

} // namespace infra
