#pragma once

#include <memory>

#include "chunkshare/auth/jwt_codec.h"
#include "chunkshare/core/config.h"
#include "chunkshare/files/file_service.h"
#include "chunkshare/http/router.h"
#include "chunkshare/links/link_engine.h"
#include "chunkshare/metadata/repository.h"
#include "chunkshare/storage/chunk_store.h"
#include "chunkshare/upload/session_manager.h"

namespace chunkshare::http {

/// @brief Long-lived components shared by route handlers and the server sessions.
struct AppServices {
    core::Config config;
    std::shared_ptr<metadata::Repository> repository;
    std::shared_ptr<storage::ChunkStore> store;
    std::shared_ptr<auth::JwtCodec> codec;
    std::shared_ptr<upload::SessionManager> sessions;
    std::shared_ptr<links::LinkEngine> links;
    std::shared_ptr<files::FileService> files;
};

/// Registers the server's JSON API routes into the provided router.
void RegisterDefaultRoutes(Router& router, const AppServices& services);

}  // namespace chunkshare::http
