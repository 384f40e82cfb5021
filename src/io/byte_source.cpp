#include "io/byte_source.hpp"
#include "core/error.hpp"
#include "util/logger.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <new>

namespace fastmarc {

bool MappedSource::open(int fd, std::string* error) {
    return mmap_.open(fd, error);
}

std::string_view MappedSource::slice(uint64_t offset, uint32_t length,
                                     std::string& /*buffer*/) const {
    uint64_t sz = mmap_.size();
    if (offset > sz || length > sz - offset) {
        throw Error(ErrorKind::kShortRead,
                    "slice [" + std::to_string(offset) + ", +" +
                    std::to_string(length) + ") exceeds mapped size " +
                    std::to_string(sz));
    }
    return std::string_view(reinterpret_cast<const char*>(mmap_.data()) + offset,
                            length);
}

StreamSource::StreamSource(int fd) : fd_(fd) {
    struct stat st;
    if (fd_ >= 0 && fstat(fd_, &st) == 0 && S_ISREG(st.st_mode))
        size_ = static_cast<uint64_t>(st.st_size);
}

size_t StreamSource::read_at(uint64_t offset, uint8_t* dst, size_t n) const {
    size_t done = 0;
    while (done < n) {
        ssize_t r = ::pread(fd_, dst + done, n - done,
                            static_cast<off_t>(offset + done));
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (r == 0) break;
        done += static_cast<size_t>(r);
    }
    return done;
}

size_t StreamSource::read(uint8_t* dst, size_t n) {
    size_t got = read_at(pos_, dst, n);
    pos_ += got;
    return got;
}

std::string_view StreamSource::slice(uint64_t offset, uint32_t length,
                                     std::string& buffer) const {
    buffer.resize(length);
    size_t got = read_at(offset, reinterpret_cast<uint8_t*>(&buffer[0]), length);
    if (got < length) {
        throw Error(ErrorKind::kShortRead,
                    "expected " + std::to_string(length) + " bytes at offset " +
                    std::to_string(offset) + ", got " + std::to_string(got));
    }
    return std::string_view(buffer.data(), length);
}

BufferedSource::BufferedSource(int fd) {
    char chunk[65536];
    try {
        while (true) {
            ssize_t r = ::read(fd, chunk, sizeof(chunk));
            if (r < 0) {
                if (errno == EINTR) continue;
                throw Error(ErrorKind::kShortRead,
                            std::string("read failed after ") +
                            std::to_string(data_.size()) + " bytes: " +
                            std::strerror(errno));
            }
            if (r == 0) break;
            data_.append(chunk, static_cast<size_t>(r));
        }
    } catch (const std::bad_alloc&) {
        throw Error(ErrorKind::kAllocationFailure,
                    "cannot buffer input beyond " + std::to_string(data_.size()) +
                    " bytes");
    }
}

std::string_view BufferedSource::slice(uint64_t offset, uint32_t length,
                                       std::string& /*buffer*/) const {
    uint64_t sz = data_.size();
    if (offset > sz || length > sz - offset) {
        throw Error(ErrorKind::kShortRead,
                    "slice [" + std::to_string(offset) + ", +" +
                    std::to_string(length) + ") exceeds buffered size " +
                    std::to_string(sz));
    }
    return std::string_view(data_.data() + offset, length);
}

bool is_unseekable(int fd) {
    struct stat st;
    if (fd < 0 || fstat(fd, &st) != 0) return false;
    return S_ISFIFO(st.st_mode) || S_ISSOCK(st.st_mode) || S_ISCHR(st.st_mode);
}

std::unique_ptr<ByteSource> make_byte_source(int fd, bool try_mmap,
                                             const Logger* logger) {
    if (is_unseekable(fd)) {
        auto buffered = std::make_unique<BufferedSource>(fd);
        if (logger)
            logger->debug("input is not seekable, buffered %llu bytes",
                          static_cast<unsigned long long>(buffered->size()));
        return buffered;
    }
    if (try_mmap) {
        auto mapped = std::make_unique<MappedSource>();
        std::string reason;
        if (mapped->open(fd, &reason))
            return mapped;
        if (logger)
            logger->debug("mmap unavailable (%s), using streaming reads",
                          reason.c_str());
    }
    return std::make_unique<StreamSource>(fd);
}

} // namespace fastmarc
