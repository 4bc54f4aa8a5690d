#include "persistence/FileBlobStore.hpp"
#include "core/Logger.hpp"
#include "core/Util.hpp"
#include <fstream>
#include <iterator>

namespace filesentry {

namespace fs = std::filesystem;

namespace {

fs::path SidecarPath(const fs::path& blob_path) {
    return fs::path(blob_path.string() + ".meta.json");
}

} // namespace

FileBlobStore::FileBlobStore(fs::path root)
    : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StorageError("FileBlobStore: cannot create root " + root_.string() + ": " + ec.message());
    }
}

bool FileBlobStore::IsValidKey(const std::string& key) {
    if (key.empty() || key.front() == '/' || key.front() == '\\') {
        return false;
    }
    if (key.find('\0') != std::string::npos || key.find('\\') != std::string::npos) {
        return false;
    }
    fs::path p(key);
    if (p.is_absolute() || p.has_root_name()) {
        return false;
    }
    for (const auto& part : p) {
        if (part == ".." || part == ".") {
            return false;
        }
    }
    return true;
}

fs::path FileBlobStore::ResolveKey(const std::string& key) const {
    if (!IsValidKey(key)) {
        throw StorageError("FileBlobStore: invalid key '" + key + "'");
    }
    return root_ / fs::path(key);
}

void FileBlobStore::WriteAtomically(const fs::path& target, const std::string& data) {
    fs::path tmp = target;
    tmp += ".tmp-" + GenerateUUID();
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError("FileBlobStore: cannot open " + tmp.string());
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw StorageError("FileBlobStore: short write to " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StorageError("FileBlobStore: rename to " + target.string() + " failed: " + ec.message());
    }
}

void FileBlobStore::Put(const std::string& key,
                        const std::vector<uint8_t>& bytes,
                        const BlobMetadata& metadata) {
    fs::path target = ResolveKey(key);
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageError("FileBlobStore: cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    nlohmann::json meta = nlohmann::json::object();
    for (const auto& [name, value] : metadata) {
        meta[name] = value;
    }

    // Sidecar first so a reader never sees a blob without its metadata.
    WriteAtomically(SidecarPath(target), DumpJson(meta, 2));
    WriteAtomically(target, std::string(bytes.begin(), bytes.end()));

    LOG_DEBUG("FileBlobStore: stored {} ({} bytes)", key, bytes.size());
}

std::optional<Blob> FileBlobStore::Get(const std::string& key) {
    fs::path target = ResolveKey(key);
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream in(target, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    Blob blob;
    blob.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());

    std::ifstream meta_in(SidecarPath(target));
    if (meta_in) {
        nlohmann::json meta = nlohmann::json::parse(meta_in, nullptr, false);
        if (meta.is_object()) {
            for (auto& [name, value] : meta.items()) {
                blob.metadata[name] = value.is_string() ? value.get<std::string>() : DumpJson(value);
            }
        } else {
            LOG_WARN("FileBlobStore: unreadable metadata sidecar for {}", key);
        }
    }
    return blob;
}

bool FileBlobStore::Delete(const std::string& key) {
    fs::path target = ResolveKey(key);
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    bool removed = fs::remove(target, ec);
    if (ec) {
        throw StorageError("FileBlobStore: delete of " + key + " failed: " + ec.message());
    }
    fs::remove(SidecarPath(target), ec);
    return removed;
}

} // namespace filesentry
