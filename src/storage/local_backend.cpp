#include "dcp/storage/local_backend.hpp"
#include "dcp/storage/checksum.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <vector>

namespace dcp::storage {
namespace fs = std::filesystem;

namespace {

std::string describe(const char* operation, const fs::path& path, const std::error_code& ec) {
    std::string message = std::string(operation) + " failed for " + path.string();
    if (ec) {
        message += ": " + ec.message();
    }
    return message;
}

class LocalInputStream : public InputStream {
public:
    LocalInputStream(fs::path path, std::ifstream stream)
        : path_(std::move(path)), stream_(std::move(stream)) {}

    dcp::Result<std::size_t> read(std::uint8_t* buffer, std::size_t size) override {
        if (size == 0) {
            return dcp::Ok<std::size_t>(0);
        }
        stream_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
        if (stream_.bad()) {
            return dcp::Err<std::size_t>(std::string("Read error on ") + path_.string());
        }
        return dcp::Ok(static_cast<std::size_t>(stream_.gcount()));
    }

private:
    fs::path path_;
    std::ifstream stream_;
};

class LocalOutputStream : public OutputStream {
public:
    LocalOutputStream(fs::path path, std::ofstream stream, std::size_t buffer_size)
        : path_(std::move(path)), stream_(std::move(stream)) {
        buffer_.reserve(buffer_size);
    }

    dcp::Result<void> write(const std::uint8_t* data, std::size_t size) override {
        if (closed_) {
            return dcp::Err<void>(std::string("Write after close on ") + path_.string());
        }
        if (buffer_.size() + size > buffer_.capacity()) {
            if (auto res = flush(); res.is_error()) {
                return res;
            }
        }
        if (size >= buffer_.capacity()) {
            stream_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
            if (!stream_) {
                return dcp::Err<void>(std::string("Write error on ") + path_.string());
            }
            return dcp::Ok();
        }
        buffer_.insert(buffer_.end(), data, data + size);
        return dcp::Ok();
    }

    dcp::Result<void> close() override {
        if (closed_) {
            return dcp::Ok();
        }
        closed_ = true;
        if (auto res = flush(); res.is_error()) {
            return res;
        }
        stream_.close();
        if (stream_.fail()) {
            return dcp::Err<void>(std::string("Close failed for ") + path_.string());
        }
        return dcp::Ok();
    }

private:
    dcp::Result<void> flush() {
        if (!buffer_.empty()) {
            stream_.write(reinterpret_cast<const char*>(buffer_.data()),
                          static_cast<std::streamsize>(buffer_.size()));
            buffer_.clear();
        }
        stream_.flush();
        if (!stream_) {
            return dcp::Err<void>(std::string("Write error on ") + path_.string());
        }
        return dcp::Ok();
    }

    fs::path path_;
    std::ofstream stream_;
    std::vector<std::uint8_t> buffer_;
    bool closed_ = false;
};

} // namespace

LocalStorage::LocalStorage(Options options) : options_(options) {}

dcp::Result<std::unique_ptr<InputStream>> LocalStorage::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return dcp::Err<std::unique_ptr<InputStream>>(describe("open", path, ec) + ": not a regular file");
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return dcp::Err<std::unique_ptr<InputStream>>(describe("open", path, ec));
    }
    return dcp::Ok<std::unique_ptr<InputStream>>(std::make_unique<LocalInputStream>(path, std::move(input)));
}

dcp::Result<std::unique_ptr<OutputStream>> LocalStorage::create(const fs::path& path,
                                                                bool overwrite,
                                                                std::size_t buffer_size,
                                                                std::int16_t replication,
                                                                std::uint64_t block_size) {
    spdlog::debug("Local create {} (replication={} block_size={} ignored)", path.string(), replication, block_size);
    std::error_code ec;
    if (!overwrite && fs::exists(path, ec)) {
        return dcp::Err<std::unique_ptr<OutputStream>>(describe("create", path, ec) + ": already exists");
    }
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            std::error_code dir_ec;
            if (!fs::is_directory(parent, dir_ec)) {
                return dcp::Err<std::unique_ptr<OutputStream>>(describe("create", parent, ec));
            }
        }
    }
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        return dcp::Err<std::unique_ptr<OutputStream>>(describe("create", path, {}));
    }
    return dcp::Ok<std::unique_ptr<OutputStream>>(
        std::make_unique<LocalOutputStream>(path, std::move(output), buffer_size));
}

dcp::Result<bool> LocalStorage::exists(const fs::path& path) {
    std::error_code ec;
    const bool found = fs::exists(path, ec);
    if (ec) {
        return dcp::Err<bool>(describe("exists", path, ec));
    }
    return dcp::Ok(found);
}

dcp::Result<void> LocalStorage::remove(const fs::path& path, bool recursive) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return dcp::Err<void>(describe("remove", path, ec) + ": no such file");
    }
    if (recursive) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    if (ec) {
        return dcp::Err<void>(describe("remove", path, ec));
    }
    return dcp::Ok();
}

dcp::Result<void> LocalStorage::mkdirs(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return dcp::Err<void>(describe("mkdirs", path, ec));
    }
    if (!fs::is_directory(path, ec)) {
        return dcp::Err<void>(describe("mkdirs", path, ec) + ": not a directory");
    }
    return dcp::Ok();
}

dcp::Result<void> LocalStorage::rename(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (fs::exists(to, ec)) {
        return dcp::Err<void>(describe("rename", to, ec) + ": destination exists");
    }
    if (to.has_parent_path() && !fs::is_directory(to.parent_path(), ec)) {
        return dcp::Err<void>(describe("rename", to, ec) + ": parent directory missing");
    }
    fs::rename(from, to, ec);
    if (ec) {
        return dcp::Err<void>(describe("rename", from, ec));
    }
    return dcp::Ok();
}

dcp::Result<FileStatus> LocalStorage::status(const fs::path& path) {
    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        return dcp::Err<FileStatus>(describe("status", path, ec));
    }
    FileStatus result;
    result.path = path;
    result.is_directory = fs::is_directory(st);
    if (!result.is_directory) {
        result.length = fs::file_size(path, ec);
        if (ec) {
            return dcp::Err<FileStatus>(describe("status", path, ec));
        }
    }
    result.replication = default_replication();
    result.block_size = options_.block_size;
    return dcp::Ok(result);
}

dcp::Result<std::optional<FileChecksum>> LocalStorage::checksum(const fs::path& path) {
    if (options_.checksum_type == ChecksumType::None) {
        return dcp::Ok(std::optional<FileChecksum>{});
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return dcp::Err<std::optional<FileChecksum>>(describe("checksum", path, {}));
    }
    ChecksumBuilder builder(options_.checksum_type, options_.block_size);
    char buffer[4096];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        builder.update(reinterpret_cast<const std::uint8_t*>(buffer),
                       static_cast<std::size_t>(input.gcount()));
    }
    if (input.bad()) {
        return dcp::Err<std::optional<FileChecksum>>(describe("checksum", path, {}) + ": read error");
    }
    return dcp::Ok(builder.finish());
}

} // namespace dcp::storage
