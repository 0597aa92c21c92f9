#include "dcp/storage/memory_backend.hpp"
#include "dcp/storage/checksum.hpp"

#include <algorithm>
#include <cstring>

namespace dcp::storage {
namespace fs = std::filesystem;

namespace {

class MemoryReader : public InputStream {
public:
    explicit MemoryReader(std::shared_ptr<const std::vector<std::uint8_t>> data)
        : data_(std::move(data)) {}

    dcp::Result<std::size_t> read(std::uint8_t* buffer, std::size_t size) override {
        const std::size_t available = data_->size() - offset_;
        const std::size_t count = std::min(available, size);
        if (count > 0) {
            std::memcpy(buffer, data_->data() + offset_, count);
            offset_ += count;
        }
        return dcp::Ok(count);
    }

private:
    std::shared_ptr<const std::vector<std::uint8_t>> data_;
    std::size_t offset_ = 0;
};

} // namespace

class MemoryStorage::Writer : public OutputStream {
public:
    Writer(MemoryStorage& owner, std::string key) : owner_(owner), key_(std::move(key)) {}

    dcp::Result<void> write(const std::uint8_t* data, std::size_t size) override {
        if (closed_) {
            return dcp::Err<void>(std::string("Write after close on ") + key_);
        }
        buffer_.insert(buffer_.end(), data, data + size);
        return dcp::Ok();
    }

    dcp::Result<void> close() override {
        if (closed_) {
            return dcp::Ok();
        }
        closed_ = true;
        return owner_.commit(key_, std::move(buffer_));
    }

private:
    MemoryStorage& owner_;
    std::string key_;
    std::vector<std::uint8_t> buffer_;
    bool closed_ = false;
};

MemoryStorage::MemoryStorage() : MemoryStorage(Options{}) {}

MemoryStorage::MemoryStorage(Options options) : options_(options) {
    Node root;
    root.is_directory = true;
    nodes_.emplace("/", root);
}

std::string MemoryStorage::key(const fs::path& path) {
    std::string raw = path.generic_string();
    if (raw.empty() || raw.front() != '/') {
        raw.insert(0, "/");
    }
    std::string normalized = fs::path(raw).lexically_normal().generic_string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

std::string MemoryStorage::parent_key(const std::string& key) {
    const auto pos = key.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return "/";
    }
    return key.substr(0, pos);
}

void MemoryStorage::make_parents_locked(const std::string& key) {
    std::string parent = parent_key(key);
    while (nodes_.find(parent) == nodes_.end()) {
        Node dir;
        dir.is_directory = true;
        nodes_.emplace(parent, dir);
        parent = parent_key(parent);
    }
}

bool MemoryStorage::has_children_locked(const std::string& key) const {
    const std::string prefix = key == "/" ? key : key + "/";
    auto it = nodes_.lower_bound(prefix);
    if (it != nodes_.end() && it->first == key) {
        ++it;
    }
    return it != nodes_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

dcp::Result<void> MemoryStorage::commit(const std::string& key, std::vector<std::uint8_t> data) {
    std::lock_guard lock(mutex_);
    auto it = nodes_.find(key);
    if (it == nodes_.end() || it->second.is_directory) {
        return dcp::Err<void>(std::string("File vanished before close: ") + key);
    }
    it->second.data = std::make_shared<const std::vector<std::uint8_t>>(std::move(data));
    return dcp::Ok();
}

dcp::Result<std::unique_ptr<InputStream>> MemoryStorage::open(const fs::path& path) {
    const auto k = key(path);
    std::lock_guard lock(mutex_);
    const auto it = nodes_.find(k);
    if (it == nodes_.end()) {
        return dcp::Err<std::unique_ptr<InputStream>>(std::string("No such file: ") + k);
    }
    if (it->second.is_directory) {
        return dcp::Err<std::unique_ptr<InputStream>>(std::string("Is a directory: ") + k);
    }
    return dcp::Ok<std::unique_ptr<InputStream>>(std::make_unique<MemoryReader>(it->second.data));
}

dcp::Result<std::unique_ptr<OutputStream>> MemoryStorage::create(const fs::path& path,
                                                                 bool overwrite,
                                                                 std::size_t /*buffer_size*/,
                                                                 std::int16_t replication,
                                                                 std::uint64_t block_size) {
    const auto k = key(path);
    std::lock_guard lock(mutex_);
    const auto it = nodes_.find(k);
    if (it != nodes_.end()) {
        if (it->second.is_directory) {
            return dcp::Err<std::unique_ptr<OutputStream>>(std::string("Is a directory: ") + k);
        }
        if (!overwrite) {
            return dcp::Err<std::unique_ptr<OutputStream>>(std::string("File exists: ") + k);
        }
    }
    for (auto parent = parent_key(k); parent != "/"; parent = parent_key(parent)) {
        const auto p = nodes_.find(parent);
        if (p != nodes_.end() && !p->second.is_directory) {
            return dcp::Err<std::unique_ptr<OutputStream>>(std::string("Parent is a file: ") + parent);
        }
    }
    make_parents_locked(k);

    Node file;
    file.replication = replication > 0 ? replication : options_.default_replication;
    file.block_size = block_size > 0 ? block_size : options_.default_block_size;
    file.data = std::make_shared<const std::vector<std::uint8_t>>();
    nodes_[k] = file;
    return dcp::Ok<std::unique_ptr<OutputStream>>(std::make_unique<Writer>(*this, k));
}

dcp::Result<bool> MemoryStorage::exists(const fs::path& path) {
    const auto k = key(path);
    std::lock_guard lock(mutex_);
    return dcp::Ok(nodes_.find(k) != nodes_.end());
}

dcp::Result<void> MemoryStorage::remove(const fs::path& path, bool recursive) {
    const auto k = key(path);
    std::lock_guard lock(mutex_);
    const auto it = nodes_.find(k);
    if (it == nodes_.end()) {
        return dcp::Err<void>(std::string("No such file: ") + k);
    }
    if (k == "/") {
        return dcp::Err<void>(std::string("Cannot remove root"));
    }
    if (it->second.is_directory && has_children_locked(k)) {
        if (!recursive) {
            return dcp::Err<void>(std::string("Directory not empty: ") + k);
        }
        const std::string prefix = k + "/";
        for (auto child = nodes_.lower_bound(prefix);
             child != nodes_.end() && child->first.compare(0, prefix.size(), prefix) == 0;) {
            child = nodes_.erase(child);
        }
    }
    nodes_.erase(k);
    return dcp::Ok();
}

dcp::Result<void> MemoryStorage::mkdirs(const fs::path& path) {
    const auto k = key(path);
    std::lock_guard lock(mutex_);
    for (auto current = k; current != "/"; current = parent_key(current)) {
        const auto it = nodes_.find(current);
        if (it != nodes_.end() && !it->second.is_directory) {
            return dcp::Err<void>(std::string("Not a directory: ") + current);
        }
    }
    if (nodes_.find(k) == nodes_.end()) {
        make_parents_locked(k);
        Node dir;
        dir.is_directory = true;
        nodes_.emplace(k, dir);
    }
    return dcp::Ok();
}

dcp::Result<void> MemoryStorage::rename(const fs::path& from, const fs::path& to) {
    const auto src = key(from);
    const auto dst = key(to);
    std::lock_guard lock(mutex_);
    const auto it = nodes_.find(src);
    if (it == nodes_.end()) {
        return dcp::Err<void>(std::string("Rename source missing: ") + src);
    }
    if (it->second.is_directory) {
        return dcp::Err<void>(std::string("Rename of directories not supported: ") + src);
    }
    if (nodes_.find(dst) != nodes_.end()) {
        return dcp::Err<void>(std::string("Rename destination exists: ") + dst);
    }
    const auto parent = nodes_.find(parent_key(dst));
    if (parent == nodes_.end() || !parent->second.is_directory) {
        return dcp::Err<void>(std::string("Rename destination parent missing: ") + dst);
    }
    Node moved = it->second;
    nodes_.erase(it);
    nodes_.emplace(dst, std::move(moved));
    return dcp::Ok();
}

dcp::Result<FileStatus> MemoryStorage::status(const fs::path& path) {
    const auto k = key(path);
    std::lock_guard lock(mutex_);
    const auto it = nodes_.find(k);
    if (it == nodes_.end()) {
        return dcp::Err<FileStatus>(std::string("No such file: ") + k);
    }
    FileStatus st;
    st.path = k;
    st.is_directory = it->second.is_directory;
    if (!st.is_directory) {
        st.length = it->second.data->size();
        st.replication = it->second.replication;
        st.block_size = it->second.block_size;
    }
    return dcp::Ok(st);
}

dcp::Result<std::optional<FileChecksum>> MemoryStorage::checksum(const fs::path& path) {
    const auto k = key(path);
    std::shared_ptr<const std::vector<std::uint8_t>> data;
    std::uint64_t block_size = 0;
    {
        std::lock_guard lock(mutex_);
        const auto it = nodes_.find(k);
        if (it == nodes_.end() || it->second.is_directory) {
            return dcp::Err<std::optional<FileChecksum>>(std::string("No such file: ") + k);
        }
        data = it->second.data;
        block_size = it->second.block_size;
    }
    return dcp::Ok(compute_checksum(options_.checksum_type, block_size, data->data(), data->size()));
}

dcp::Result<void> MemoryStorage::put(const fs::path& path,
                                     const std::string& content,
                                     std::int16_t replication,
                                     std::uint64_t block_size) {
    auto stream = create(path, true, 0, replication, block_size);
    if (stream.is_error()) {
        return dcp::Err<void>(stream.error());
    }
    auto& out = stream.value();
    if (auto res = out->write(reinterpret_cast<const std::uint8_t*>(content.data()), content.size());
        res.is_error()) {
        return res;
    }
    return out->close();
}

dcp::Result<std::string> MemoryStorage::get(const fs::path& path) const {
    const auto k = key(path);
    std::lock_guard lock(mutex_);
    const auto it = nodes_.find(k);
    if (it == nodes_.end() || it->second.is_directory) {
        return dcp::Err<std::string>(std::string("No such file: ") + k);
    }
    const auto& data = *it->second.data;
    return dcp::Ok(std::string(data.begin(), data.end()));
}

std::vector<std::string> MemoryStorage::list() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> paths;
    paths.reserve(nodes_.size());
    for (const auto& [path, node] : nodes_) {
        paths.push_back(path);
    }
    return paths;
}

} // namespace dcp::storage
