#include <conduit/net/buffer.h>

#include <algorithm>
#include <stdexcept>

namespace conduit::net {

// ---------------------------------------------------------------------------
// BufferChunk
// ---------------------------------------------------------------------------

BufferChunk::BufferChunk(std::vector<uint8_t> bytes)
    : storage_(std::make_shared<const std::vector<uint8_t>>(std::move(bytes))),
      offset_(0),
      size_(storage_->size()) {}

BufferChunk::BufferChunk(const uint8_t* data, size_t len)
    : BufferChunk(std::vector<uint8_t>(data, data + len)) {}

BufferChunk BufferChunk::from_string(std::string_view text) {
    return BufferChunk(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

const uint8_t* BufferChunk::data() const {
    if (!storage_) {
        return nullptr;
    }
    return storage_->data() + offset_;
}

BufferChunk BufferChunk::slice(size_t offset, size_t len) const {
    BufferChunk result;
    if (offset >= size_) {
        return result;
    }
    result.storage_ = storage_;
    result.offset_ = offset_ + offset;
    result.size_ = std::min(len, size_ - offset);
    return result;
}

std::string_view BufferChunk::as_string_view() const {
    if (size_ == 0) {
        return {};
    }
    return std::string_view(reinterpret_cast<const char*>(data()), size_);
}

std::string BufferChunk::to_string() const {
    return std::string(as_string_view());
}

bool BufferChunk::shares_storage_with(const BufferChunk& other) const {
    return storage_ != nullptr && storage_ == other.storage_;
}

// ---------------------------------------------------------------------------
// Buffer
// ---------------------------------------------------------------------------

void Buffer::put(BufferChunk chunk) {
    if (chunk.empty()) {
        return;
    }
    length_ += chunk.size();
    chunks_.push_back(std::move(chunk));
}

void Buffer::put(std::string_view bytes) {
    put(BufferChunk::from_string(bytes));
}

void Buffer::put(const uint8_t* data, size_t len) {
    if (len == 0) {
        return;
    }
    put(BufferChunk(data, len));
}

void Buffer::put(const Buffer& other) {
    for (const auto& chunk : other.chunks_) {
        put(chunk);
    }
}

const BufferChunk& Buffer::front_chunk() const {
    if (chunks_.empty()) {
        throw std::out_of_range("Buffer::front_chunk on empty buffer");
    }
    return chunks_.front();
}

void Buffer::pop_front_chunk() {
    if (chunks_.empty()) {
        return;
    }
    length_ -= chunks_.front().size();
    chunks_.pop_front();
}

void Buffer::consume(size_t n) {
    while (n > 0 && !chunks_.empty()) {
        auto& front = chunks_.front();
        if (front.size() <= n) {
            n -= front.size();
            pop_front_chunk();
            continue;
        }
        front = front.slice(n);
        length_ -= n;
        n = 0;
    }
}

BufferChunk Buffer::data() const {
    if (chunks_.empty()) {
        return {};
    }
    if (chunks_.size() == 1) {
        return chunks_.front();
    }
    std::vector<uint8_t> flat;
    flat.reserve(length_);
    for (const auto& chunk : chunks_) {
        flat.insert(flat.end(), chunk.data(), chunk.data() + chunk.size());
    }
    return BufferChunk(std::move(flat));
}

std::vector<BufferChunk> Buffer::chunks() const {
    return std::vector<BufferChunk>(chunks_.begin(), chunks_.end());
}

std::string Buffer::to_string() const {
    std::string out;
    out.reserve(length_);
    for (const auto& chunk : chunks_) {
        out.append(chunk.as_string_view());
    }
    return out;
}

void Buffer::clear() {
    chunks_.clear();
    length_ = 0;
}

} // namespace conduit::net
