#include "easel/fs/async_file.h"
#include <fstream>
#include <iostream>

namespace easel {
namespace fs {

struct AsyncFileReader::State {
    async::EventLoop& loop;
    size_t maxBytes;
    int pending = 0;

    State(async::EventLoop& l, size_t max) : loop(l), maxBytes(max) {}
};

namespace {

// Owned by libuv from uv_queue_work until afterRead
struct ReadJob {
    uv_work_t work{};
    std::string path;
    size_t maxBytes = 0;
    AsyncFileCallback callback;
    std::vector<uint8_t> data;
    std::string error;
    // The reader may be destroyed while the job is on a worker
    std::weak_ptr<AsyncFileReader::State> reader;
};

// Worker thread: touches nothing but the job
void readOnWorker(uv_work_t* req) {
    auto* job = static_cast<ReadJob*>(req->data);

    std::ifstream in(job->path, std::ios::binary | std::ios::ate);
    if (!in) {
        job->error = "Cannot open " + job->path;
        return;
    }
    std::streamoff end = in.tellg();
    if (end < 0) {
        job->error = "Cannot read " + job->path;
        return;
    }
    size_t size = static_cast<size_t>(end);
    if (size > job->maxBytes) {
        job->error = job->path + " is larger than " + std::to_string(job->maxBytes) + " bytes";
        return;
    }

    job->data.resize(size);
    in.seekg(0, std::ios::beg);
    if (size > 0 && !in.read(reinterpret_cast<char*>(job->data.data()), static_cast<std::streamsize>(size))) {
        job->error = "Cannot read " + job->path;
        job->data.clear();
    }
}

// Loop thread
void afterRead(uv_work_t* req, int status) {
    std::unique_ptr<ReadJob> job(static_cast<ReadJob*>(req->data));
    auto reader = job->reader.lock();
    if (!reader) return;

    reader->pending--;
    if (status == UV_ECANCELED) {
        job->error = "Read cancelled: " + job->path;
        job->data.clear();
    }
    if (job->callback) {
        reader->loop.dispatch([&job]() { job->callback(std::move(job->data), std::move(job->error)); });
    }
}

} // namespace

AsyncFileReader::AsyncFileReader(async::EventLoop& loop, size_t maxBytes)
    : state_(std::make_shared<State>(loop, maxBytes)) {}

AsyncFileReader::~AsyncFileReader() = default;

void AsyncFileReader::readFile(const std::string& path, AsyncFileCallback callback) {
    uv_loop_t* uvLoop = state_->loop.handle();
    if (!uvLoop || !state_->loop.isAvailable()) {
        if (callback) callback({}, "Event loop not available for " + path);
        return;
    }

    auto* job = new ReadJob();
    job->work.data = job;
    job->path = path;
    job->maxBytes = state_->maxBytes;
    job->callback = std::move(callback);
    job->reader = state_;

    int rc = uv_queue_work(uvLoop, &job->work, readOnWorker, afterRead);
    if (rc != 0) {
        std::cerr << "[AsyncFile] Cannot queue read of " << path << ": " << uv_strerror(rc) << std::endl;
        AsyncFileCallback failed = std::move(job->callback);
        delete job;
        if (failed) failed({}, std::string("Cannot queue read: ") + uv_strerror(rc));
        return;
    }
    state_->pending++;
}

int AsyncFileReader::pendingReads() const {
    return state_->pending;
}

} // namespace fs
} // namespace easel
