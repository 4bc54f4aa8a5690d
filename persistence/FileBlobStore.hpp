#pragma once

#include "persistence/Storage.hpp"
#include <filesystem>
#include <mutex>
#include <string>

namespace filesentry {

// Filesystem-rooted blob store. Each blob lives at <root>/<key> with a JSON
// metadata sidecar at <root>/<key>.meta.json.
class FileBlobStore : public BlobStore {
public:
    explicit FileBlobStore(std::filesystem::path root);

    void Put(const std::string& key,
             const std::vector<uint8_t>& bytes,
             const BlobMetadata& metadata) override;
    std::optional<Blob> Get(const std::string& key) override;
    bool Delete(const std::string& key) override;

    const std::filesystem::path& Root() const { return root_; }

    static bool IsValidKey(const std::string& key);

private:
    std::filesystem::path ResolveKey(const std::string& key) const;
    static void WriteAtomically(const std::filesystem::path& target, const std::string& data);

    std::filesystem::path root_;
    std::mutex mutex_;
};

} // namespace filesentry
