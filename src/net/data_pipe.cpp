#include <conduit/net/data_pipe.h>
#include <conduit/net/errors.h>

#include <stdexcept>

namespace conduit::net {

void DataPipe::insert(std::unique_ptr<DataStage> stage) {
    if (started_) {
        throw std::logic_error("DataPipe::insert called after data was put");
    }
    if (stage) {
        stages_.push_back(std::move(stage));
    }
}

std::vector<BufferChunk> DataPipe::process(DataStage& stage, const std::vector<BufferChunk>& input) {
    for (const auto& chunk : input) {
        stage.put(chunk);
    }
    std::vector<BufferChunk> output;
    while (!stage.empty()) {
        output.push_back(stage.get());
    }
    return output;
}

void DataPipe::put(const BufferChunk& data) {
    started_ = true;
    if (data.empty()) {
        return;
    }
    if (stages_.empty()) {
        buffer_.put(data);
        return;
    }

    try {
        std::vector<BufferChunk> product{data};
        for (auto& stage : stages_) {
            product = process(*stage, product);
        }
        for (auto& chunk : product) {
            buffer_.put(std::move(chunk));
        }
    } catch (const NetError&) {
        throw;
    } catch (const std::exception& e) {
        throw DecodingException(e.what());
    }
}

void DataPipe::flush() {
    started_ = true;
    if (flushed_) {
        return;
    }
    flushed_ = true;

    try {
        std::vector<BufferChunk> product;
        for (auto& stage : stages_) {
            for (const auto& chunk : product) {
                stage->put(chunk);
            }
            stage->flush();
            product.clear();
            while (!stage->empty()) {
                product.push_back(stage->get());
            }
        }
        for (auto& chunk : product) {
            buffer_.put(std::move(chunk));
        }
    } catch (const NetError&) {
        throw;
    } catch (const std::exception& e) {
        throw DecodingException(e.what());
    }
}

BufferChunk DataPipe::get() {
    BufferChunk result = buffer_.data();
    buffer_.clear();
    return result;
}

std::vector<BufferChunk> DataPipe::get_chunks() {
    auto result = buffer_.chunks();
    buffer_.clear();
    return result;
}

} // namespace conduit::net
