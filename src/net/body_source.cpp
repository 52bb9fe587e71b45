#include <conduit/net/body_source.h>
#include <conduit/net/errors.h>

#include <fstream>
#include <utility>

namespace conduit::net {

namespace {

class StringBody : public BodySource {
public:
    explicit StringBody(std::string data) : chunk_(BufferChunk::from_string(data)) {}

    std::optional<size_t> length() const override { return chunk_.size(); }

    std::optional<BufferChunk> next_chunk() override {
        if (sent_ || chunk_.empty()) {
            return std::nullopt;
        }
        sent_ = true;
        return chunk_;
    }

    bool rewind() override {
        sent_ = false;
        return true;
    }

private:
    BufferChunk chunk_;
    bool sent_ = false;
};

class FileBody : public BodySource {
public:
    FileBody(const std::string& path, size_t chunk_size)
        : path_(path), chunk_size_(chunk_size == 0 ? 16 * 1024 : chunk_size) {
        file_.open(path_, std::ios::binary | std::ios::ate);
        if (!file_) {
            throw RequestException("Can't open " + path_ + " for upload");
        }
        size_ = static_cast<size_t>(file_.tellg());
        file_.seekg(0);
    }

    std::optional<size_t> length() const override { return size_; }

    std::optional<BufferChunk> next_chunk() override {
        std::vector<uint8_t> bytes(chunk_size_);
        file_.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        const auto got = static_cast<size_t>(file_.gcount());
        if (got == 0) {
            if (file_.bad()) {
                throw RequestException("Error reading " + path_);
            }
            return std::nullopt;
        }
        bytes.resize(got);
        return BufferChunk(std::move(bytes));
    }

    bool rewind() override {
        file_.clear();
        file_.seekg(0);
        return static_cast<bool>(file_);
    }

private:
    std::string path_;
    size_t chunk_size_;
    std::ifstream file_;
    size_t size_ = 0;
};

class ChunkListBody : public BodySource {
public:
    explicit ChunkListBody(std::vector<BufferChunk> chunks) : chunks_(std::move(chunks)) {}

    std::optional<size_t> length() const override { return std::nullopt; }

    std::optional<BufferChunk> next_chunk() override {
        while (next_ < chunks_.size()) {
            const BufferChunk& chunk = chunks_[next_++];
            if (!chunk.empty()) {
                return chunk;
            }
        }
        return std::nullopt;
    }

    bool rewind() override {
        next_ = 0;
        return true;
    }

private:
    std::vector<BufferChunk> chunks_;
    size_t next_ = 0;
};

class GeneratorBody : public BodySource {
public:
    explicit GeneratorBody(ChunkGenerator generator) : generator_(std::move(generator)) {}

    std::optional<size_t> length() const override { return std::nullopt; }

    std::optional<BufferChunk> next_chunk() override {
        while (!done_) {
            started_ = true;
            auto chunk = generator_ ? generator_() : std::nullopt;
            if (!chunk) {
                done_ = true;
                break;
            }
            if (!chunk->empty()) {
                return chunk;
            }
        }
        return std::nullopt;
    }

    bool rewind() override { return !started_; }

private:
    ChunkGenerator generator_;
    bool started_ = false;
    bool done_ = false;
};

} // anonymous namespace

std::unique_ptr<BodySource> body_from_string(std::string data) {
    return std::make_unique<StringBody>(std::move(data));
}

std::unique_ptr<BodySource> body_from_file(const std::string& path, size_t chunk_size) {
    return std::make_unique<FileBody>(path, chunk_size);
}

std::unique_ptr<BodySource> body_from_chunks(std::vector<BufferChunk> chunks) {
    return std::make_unique<ChunkListBody>(std::move(chunks));
}

std::unique_ptr<BodySource> body_from_generator(ChunkGenerator generator) {
    return std::make_unique<GeneratorBody>(std::move(generator));
}

} // namespace conduit::net
