#pragma once

#include <string>

#include <boost/asio/thread_pool.hpp>

namespace chunkshare::upload {

class FinalizeWorker;

/// @brief Unit of finalize work handed from the request path to the worker.
struct FinalizeJob {
    std::string session_id;
    std::string file_id;
};

/// @brief Fire-and-forget hand-off of finalize jobs.
class FinalizeQueue {
public:
    virtual ~FinalizeQueue() = default;
    virtual void Submit(const FinalizeJob& job) = 0;
};

/// @brief In-process queue running jobs on a fixed Asio thread pool.
class AsioFinalizeQueue : public FinalizeQueue {
public:
    AsioFinalizeQueue(FinalizeWorker& worker, int threads);
    ~AsioFinalizeQueue() override;

    void Submit(const FinalizeJob& job) override;
    /// @brief Wait for queued jobs to finish and stop accepting new ones.
    void Shutdown();

private:
    FinalizeWorker& worker_;
    boost::asio::thread_pool pool_;
};

}  // namespace chunkshare::upload
