#pragma once

#include "core/CancellationToken.hpp"
#include "engine/ThreatTypes.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace filesentry {

// The bytes under scan plus a decoded text sample. Byte-family detectors
// read `bytes`; text-family detectors read `text`, which covers the first
// `sample_limit` bytes with offsets equal to byte offsets.
class ScanContent {
public:
    static std::shared_ptr<const ScanContent> Create(std::vector<uint8_t> bytes,
                                                     FileMetadata metadata,
                                                     size_t sample_limit);

    const std::vector<uint8_t>& Bytes() const { return bytes_; }
    const std::string& Text() const { return text_; }
    const FileMetadata& Metadata() const { return metadata_; }
    bool IsTruncated() const { return truncated_; }
    size_t ReplacedBytes() const { return replaced_bytes_; }

    // 1-based line and column of a text offset.
    uint32_t LineAt(size_t offset) const;
    uint32_t ColumnAt(size_t offset) const;

    // Up to `radius` characters either side of [offset, offset + length).
    std::string ContextAt(size_t offset, size_t length, size_t radius) const;

    static std::string DecodeSample(const std::vector<uint8_t>& bytes, size_t limit,
                                    size_t* replaced = nullptr);

private:
    ScanContent() = default;

    std::vector<uint8_t> bytes_;
    std::string text_;
    FileMetadata metadata_;
    bool truncated_{false};
    size_t replaced_bytes_{0};
    std::vector<size_t> line_starts_;
};

} // namespace filesentry
