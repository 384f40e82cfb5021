#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace fastmarc {

// Read-only private mapping of a whole file. The descriptor passed to
// open() stays owned by the caller; only the mapping is released here.
class MmapFile {
public:
    MmapFile() = default;
    ~MmapFile();

    MmapFile(const MmapFile&) = delete;
    MmapFile& operator=(const MmapFile&) = delete;

    MmapFile(MmapFile&& other) noexcept;
    MmapFile& operator=(MmapFile&& other) noexcept;

    // Map the regular file behind fd. On failure returns false and, if
    // error is non-null, stores the reason there.
    bool open(int fd, std::string* error = nullptr);
    void close();

    bool is_open() const { return data_ != nullptr; }
    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }

    // Whole-mapping madvise hint (see madvise(2), e.g. MADV_RANDOM)
    bool advise(int advice);

private:
    uint8_t* data_ = nullptr;
    size_t size_ = 0;
};

} // namespace fastmarc
