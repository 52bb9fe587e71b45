#pragma once
#include <conduit/net/buffer.h>
#include <memory>
#include <vector>

namespace conduit::net {

// One byte-stream transform. put() never blocks; whatever the stage
// produces is handed out by get() one unit at a time, in input order.
class DataStage {
public:
    virtual ~DataStage() = default;

    virtual void put(const BufferChunk& data) = 0;
    // Pop one produced unit. Only valid while !empty().
    virtual BufferChunk get() = 0;
    virtual bool empty() const = 0;
    // End of input: emit anything still held back.
    virtual void flush() = 0;
};

// Left-to-right chain of stages (e.g. dechunk, then decompress). With no
// stages the pipe is the identity transform.
class DataPipe : public DataStage {
public:
    DataPipe() = default;

    DataPipe(const DataPipe&) = delete;
    DataPipe& operator=(const DataPipe&) = delete;

    // Append a stage. Throws std::logic_error once data has been put.
    void insert(std::unique_ptr<DataStage> stage);
    size_t stage_count() const { return stages_.size(); }

    // A stage failure that is not already a NetError surfaces as
    // DecodingException with the stage's message.
    void put(const BufferChunk& data) override;
    void flush() override;

    // Everything decoded so far as one chunk; clears the pipe's buffer.
    BufferChunk get() override;
    // Same, without flattening.
    std::vector<BufferChunk> get_chunks();

    bool empty() const override { return buffer_.empty(); }
    size_t length() const { return buffer_.length(); }

private:
    static std::vector<BufferChunk> process(DataStage& stage, const std::vector<BufferChunk>& input);

    std::vector<std::unique_ptr<DataStage>> stages_;
    Buffer buffer_;
    bool started_ = false;
    bool flushed_ = false;
};

} // namespace conduit::net
