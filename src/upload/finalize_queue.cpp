#include "chunkshare/upload/finalize_queue.h"

#include <boost/asio/post.hpp>

#include "chunkshare/core/logger.h"
#include "chunkshare/upload/finalize_worker.h"

namespace chunkshare::upload {

AsioFinalizeQueue::AsioFinalizeQueue(FinalizeWorker& worker, int threads)
    : worker_(worker), pool_(static_cast<std::size_t>(threads)) {}

AsioFinalizeQueue::~AsioFinalizeQueue() { Shutdown(); }

void AsioFinalizeQueue::Submit(const FinalizeJob& job) {
    boost::asio::post(pool_, [this, job]() {
        try {
            worker_.Finalize(job);
        } catch (const std::exception& ex) {
            core::LogError("finalize job for session " + job.session_id +
                           " threw: " + ex.what());
        }
    });
}

void AsioFinalizeQueue::Shutdown() { pool_.join(); }

}  // namespace chunkshare::upload
