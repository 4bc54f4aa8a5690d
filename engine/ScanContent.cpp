#include "engine/ScanContent.hpp"
#include "engine/ScanError.hpp"
#include <algorithm>
#include <new>

namespace filesentry {

namespace {

// Length of the well-formed UTF-8 sequence starting at data[i], or 0.
size_t Utf8SequenceLength(const std::vector<uint8_t>& data, size_t i, size_t end) {
    uint8_t lead = data[i];
    size_t length = 0;
    uint32_t min_code_point = 0;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        min_code_point = 0x80;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        min_code_point = 0x800;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        min_code_point = 0x10000;
    } else {
        return 0;
    }
    if (i + length > end) {
        return 0;
    }

    uint32_t code_point = lead & (0xFF >> (length + 1));
    for (size_t k = 1; k < length; ++k) {
        uint8_t b = data[i + k];
        if ((b & 0xC0) != 0x80) {
            return 0;
        }
        code_point = (code_point << 6) | (b & 0x3F);
    }
    if (code_point < min_code_point || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return 0;
    }
    return length;
}

} // namespace

std::string ScanContent::DecodeSample(const std::vector<uint8_t>& bytes, size_t limit,
                                      size_t* replaced) {
    size_t end = std::min(bytes.size(), limit);
    std::string text;
    text.reserve(end);
    size_t replaced_count = 0;

    size_t i = 0;
    while (i < end) {
        uint8_t b = bytes[i];
        if (b == 0) {
            text.push_back('?');
            ++replaced_count;
            ++i;
        } else if (b < 0x80) {
            text.push_back(static_cast<char>(b));
            ++i;
        } else {
            size_t length = Utf8SequenceLength(bytes, i, end);
            if (length == 0) {
                text.push_back('?');
                ++replaced_count;
                ++i;
            } else {
                text.append(reinterpret_cast<const char*>(&bytes[i]), length);
                i += length;
            }
        }
    }

    if (replaced) {
        *replaced = replaced_count;
    }
    return text;
}

std::shared_ptr<const ScanContent> ScanContent::Create(std::vector<uint8_t> bytes,
                                                       FileMetadata metadata,
                                                       size_t sample_limit) {
    try {
        std::shared_ptr<ScanContent> content(new ScanContent());
        content->text_ = DecodeSample(bytes, sample_limit, &content->replaced_bytes_);
        content->truncated_ = bytes.size() > sample_limit;
        content->bytes_ = std::move(bytes);
        content->metadata_ = std::move(metadata);

        content->line_starts_.push_back(0);
        for (size_t i = 0; i < content->text_.size(); ++i) {
            if (content->text_[i] == '\n') {
                content->line_starts_.push_back(i + 1);
            }
        }
        return content;
    } catch (const std::bad_alloc&) {
        throw ScanError(ScanErrorCode::DECODE_FAILURE, "Out of memory while decoding content sample");
    } catch (const std::length_error& ex) {
        throw ScanError(ScanErrorCode::DECODE_FAILURE,
                        std::string("Content sample could not be decoded: ") + ex.what());
    }
}

uint32_t ScanContent::LineAt(size_t offset) const {
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    return static_cast<uint32_t>(it - line_starts_.begin());
}

uint32_t ScanContent::ColumnAt(size_t offset) const {
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    size_t line_start = *(it - 1);
    return static_cast<uint32_t>(offset - line_start + 1);
}

std::string ScanContent::ContextAt(size_t offset, size_t length, size_t radius) const {
    if (offset >= text_.size()) {
        return std::string();
    }
    size_t start = offset > radius ? offset - radius : 0;
    size_t end = std::min(text_.size(), offset + length + radius);
    return text_.substr(start, end - start);
}

} // namespace filesentry
