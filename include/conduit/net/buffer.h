#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::net {

// Immutable view over reference-counted bytes. Copying or slicing a chunk
// shares the storage; the bytes themselves are never modified once the
// chunk exists.
class BufferChunk {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    BufferChunk() = default;
    explicit BufferChunk(std::vector<uint8_t> bytes);
    BufferChunk(const uint8_t* data, size_t len);

    static BufferChunk from_string(std::string_view text);

    const uint8_t* data() const;
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    uint8_t operator[](size_t index) const { return data()[index]; }

    // Sub-range sharing this chunk's storage. Out-of-range bounds are clipped.
    BufferChunk slice(size_t offset, size_t len = npos) const;

    std::string_view as_string_view() const;
    std::string to_string() const;

    // True when both chunks view the same storage.
    bool shares_storage_with(const BufferChunk& other) const;

private:
    std::shared_ptr<const std::vector<uint8_t>> storage_;
    size_t offset_ = 0;
    size_t size_ = 0;
};

// Append-only sequence of chunks. put() stores the chunk by reference, so
// handing data from one stage to the next never copies the payload.
class Buffer {
public:
    void put(BufferChunk chunk);
    void put(std::string_view bytes);
    void put(const uint8_t* data, size_t len);
    void put(const Buffer& other);

    size_t length() const { return length_; }
    bool empty() const { return length_ == 0; }
    size_t chunk_count() const { return chunks_.size(); }

    // FIFO access to raw chunks
    const BufferChunk& front_chunk() const;
    void pop_front_chunk();

    // Drop the first n bytes (clipped to length()).
    void consume(size_t n);

    // Contiguous view of the whole content. Copies only when the content
    // spans more than one chunk.
    BufferChunk data() const;
    std::vector<BufferChunk> chunks() const;
    std::string to_string() const;

    void clear();

private:
    std::deque<BufferChunk> chunks_;
    size_t length_ = 0;
};

} // namespace conduit::net
