#include "io/mmap_file.hpp"

#include <sys/mman.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

namespace fastmarc {

static bool fail(std::string* error, const std::string& msg) {
    if (error) *error = msg;
    return false;
}

MmapFile::~MmapFile() {
    close();
}

MmapFile::MmapFile(MmapFile&& other) noexcept
    : data_(other.data_), size_(other.size_) {
    other.data_ = nullptr;
    other.size_ = 0;
}

MmapFile& MmapFile::operator=(MmapFile&& other) noexcept {
    if (this != &other) {
        close();
        data_ = other.data_;
        size_ = other.size_;
        other.data_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

bool MmapFile::open(int fd, std::string* error) {
    close();

    if (fd < 0)
        return fail(error, "invalid file descriptor");

    struct stat st;
    if (fstat(fd, &st) != 0)
        return fail(error, std::string("fstat failed: ") + std::strerror(errno));

    // Pipes, sockets and character devices cannot be mapped
    if (!S_ISREG(st.st_mode))
        return fail(error, "not a regular file");

    if (st.st_size == 0)
        return fail(error, "file is empty");

    void* mapped = ::mmap(nullptr, static_cast<size_t>(st.st_size),
                          PROT_READ, MAP_PRIVATE, fd, 0);
    if (mapped == MAP_FAILED)
        return fail(error, std::string("mmap failed: ") + std::strerror(errno));

    data_ = static_cast<uint8_t*>(mapped);
    size_ = static_cast<size_t>(st.st_size);
    return true;
}

bool MmapFile::advise(int advice) {
    if (!data_) return false;
    return ::madvise(data_, size_, advice) == 0;
}

void MmapFile::close() {
    if (data_) {
        ::munmap(data_, size_);
        data_ = nullptr;
        size_ = 0;
    }
}

} // namespace fastmarc
