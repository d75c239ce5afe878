/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <sitepack/stream.hpp>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <string>

#ifdef __linux__
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace sitepack {

auto read_fully(input_stream &stream, std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t total = 0;
    while (total < buffer.size()) {
        auto result = stream.read(buffer.subspan(total));
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            break;
        }
        total += *result;
    }
    return total;
}

// file_stream implementation
file_stream::file_stream(std::FILE* file, const std::optional<size_t> size)
    : file_(file), file_size_(size) {}

auto file_stream::open(const std::filesystem::path &path) -> std::expected<file_stream, error> {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open file: " + std::string{std::strerror(errno)}});
    }

    // Try to get file size
    std::optional<size_t> file_size;
    if (std::fseek(file, 0, SEEK_END) == 0) {
        if (const long pos = std::ftell(file); pos >= 0) {
            file_size = static_cast<size_t>(pos);
        }
        if (std::fseek(file, 0, SEEK_SET) != 0) {
            std::fclose(file);
            return std::unexpected(error{error_code::io_error,
                "Failed to rewind file: " + std::string{std::strerror(errno)}});
        }
    }

    return file_stream{file, file_size};
}

auto file_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t bytes_read = std::fread(buffer.data(), 1, buffer.size(), file_.get());

    if (bytes_read == 0 && std::ferror(file_.get())) {
        return std::unexpected(error{error_code::io_error,
            "File read error: " + std::string{std::strerror(errno)}});
    }

    return bytes_read;
}

auto file_stream::skip(size_t bytes) -> std::expected<void, error> {
    // fseek happily moves past EOF, so bound the skip by the known size
    if (file_size_.has_value()) {
        const size_t current = position();
        if (current > *file_size_ || bytes > *file_size_ - current) {
            return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
        }
    }

    if (std::fseek(file_.get(), static_cast<long>(bytes), SEEK_CUR) != 0) {
        return std::unexpected(error{error_code::io_error,
            "File seek error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

auto file_stream::seek(size_t position) -> std::expected<void, error> {
    if (std::fseek(file_.get(), static_cast<long>(position), SEEK_SET) != 0) {
        return std::unexpected(error{error_code::io_error,
            "File seek error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

size_t file_stream::position() const {
    long pos = std::ftell(file_.get());
    return pos >= 0 ? static_cast<size_t>(pos) : 0;
}

#ifdef __linux__
// mmap_stream implementation
mmap_stream::mmap_stream(void* ptr, const size_t size)
    : mapping_{ptr, mapping_deleter{size}}
    , data_{static_cast<const std::byte*>(ptr), size} {}

auto mmap_stream::create(const std::filesystem::path &path) -> std::expected<mmap_stream, error> {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd == -1) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open file: " + std::string{std::strerror(errno)}});
    }

    struct stat st{};
    if (::fstat(fd, &st) == -1) {
        ::close(fd);
        return std::unexpected(error{error_code::io_error,
            "Failed to stat file: " + std::string{std::strerror(errno)}});
    }

    const size_t file_size = static_cast<size_t>(st.st_size);

    void* ptr;
    if (file_size == 0) {
        ptr = nullptr;
    } else {
        ptr = ::mmap(nullptr, file_size, PROT_READ, MAP_PRIVATE, fd, 0);
        if (ptr == MAP_FAILED) {
            ::close(fd);
            return std::unexpected(error{error_code::io_error,
                "Memory mapping failed: " + std::string{std::strerror(errno)}});
        }

        // Archives are consumed strictly front to back
        ::madvise(ptr, file_size, MADV_SEQUENTIAL);
    }

    ::close(fd);

    return mmap_stream{ptr, file_size};
}

auto mmap_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t available = data_.size() - position_;
    size_t to_read = std::min(buffer.size(), available);

    std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                       static_cast<std::ptrdiff_t>(to_read), buffer.begin());
    position_ += to_read;

    return to_read;
}

auto mmap_stream::skip(size_t bytes) -> std::expected<void, error> {
    if (bytes > data_.size() - position_) {
        return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
    }
    position_ += bytes;
    return {};
}

auto mmap_stream::seek(size_t position) -> std::expected<void, error> {
    if (position > data_.size()) {
        return std::unexpected(error{error_code::io_error, "Seek past end of stream"});
    }
    position_ = position;
    return {};
}

size_t mmap_stream::position() const {
    return position_;
}
#endif

// replay_stream implementation
auto replay_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const size_t buffered = prefix_.size() - prefix_position_;
    if (buffered > 0) {
        const size_t to_copy = std::min(buffer.size(), buffered);
        std::ranges::copy_n(prefix_.begin() + static_cast<std::ptrdiff_t>(prefix_position_),
                           static_cast<std::ptrdiff_t>(to_copy), buffer.begin());
        prefix_position_ += to_copy;
        return to_copy;
    }

    return inner_->read(buffer);
}

auto replay_stream::skip(size_t bytes) -> std::expected<void, error> {
    const size_t buffered = prefix_.size() - prefix_position_;
    const size_t from_prefix = std::min(bytes, buffered);
    const size_t from_inner = bytes - from_prefix;

    if (from_inner > 0) {
        if (auto result = inner_->skip(from_inner); !result) {
            return std::unexpected(result.error());
        }
    }

    prefix_position_ += from_prefix;
    return {};
}

} // namespace sitepack
