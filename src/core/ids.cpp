#include "chunkshare/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace chunkshare::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator::defaultGenerator().createOne().toString();
}

std::string GenerateId() {
    // Random (v4) UUIDs; ids are also used as path components.
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

}  // namespace chunkshare::core
