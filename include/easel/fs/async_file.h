#pragma once

/**
 * AsyncFileReader - local asset files read on the libuv thread pool
 *
 *   context.files().readFile("assets/ball.png", [](std::vector<uint8_t> data, std::string error) {
 *       if (error.empty()) {
 *           // data holds the whole file
 *       }
 *   });
 */

#include "easel/async/event_loop.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace easel {
namespace fs {

// data is empty whenever error is set
using AsyncFileCallback = std::function<void(std::vector<uint8_t> data, std::string error)>;

class AsyncFileReader {
public:
    explicit AsyncFileReader(async::EventLoop& loop, size_t maxBytes = 64 * 1024 * 1024);
    ~AsyncFileReader();

    /**
     * Read the whole file on a worker thread. The callback runs on the loop
     * thread after the read, or inline with an error if the read cannot be
     * queued (loop not initialized or shutting down).
     */
    void readFile(const std::string& path, AsyncFileCallback callback);

    int pendingReads() const;

    AsyncFileReader(const AsyncFileReader&) = delete;
    AsyncFileReader& operator=(const AsyncFileReader&) = delete;

    struct State;

private:
    std::shared_ptr<State> state_;
};

} // namespace fs
} // namespace easel
