#include "storage_client.hpp"
#include "config.hpp"

namespace incfile {

bool is_remote_path(const std::string& path) {
    return path.rfind(REMOTE_SCHEME, 0) == 0;
}

} // namespace incfile
