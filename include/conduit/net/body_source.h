#pragma once
#include <conduit/net/buffer.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conduit::net {

// Request body producer. A known length() is sent with Content-Length,
// an unknown one with chunked transfer coding, one frame per chunk.
class BodySource {
public:
    virtual ~BodySource() = default;

    virtual std::optional<size_t> length() const = 0;
    // Next piece of the body, or nullopt at the end.
    virtual std::optional<BufferChunk> next_chunk() = 0;
    // Restart from the beginning for a resend; false when the body cannot
    // be produced again.
    virtual bool rewind() = 0;
};

using ChunkGenerator = std::function<std::optional<BufferChunk>()>;

std::unique_ptr<BodySource> body_from_string(std::string data);
// Streams the file in chunk_size pieces; throws RequestException if it
// cannot be opened.
std::unique_ptr<BodySource> body_from_file(const std::string& path, size_t chunk_size = 16 * 1024);
// Length unknown up front; sent chunked.
std::unique_ptr<BodySource> body_from_chunks(std::vector<BufferChunk> chunks);
// One-shot source; cannot be rewound.
std::unique_ptr<BodySource> body_from_generator(ChunkGenerator generator);

} // namespace conduit::net
