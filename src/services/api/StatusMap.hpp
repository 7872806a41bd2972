#pragma once
#include "core/storage/StoreError.hpp"

namespace vf {

// HTTP status a StoreError is answered with.
int http_status_for(ErrorCode c);

} // namespace vf
