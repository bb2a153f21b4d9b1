// ============================================================================
// convq/net/request_handler.hpp - Request Operation Boundary
// ============================================================================
//
// ConnectionManager decodes Request frames and hands (op, args) to a
// RequestHandler; whatever comes back is encoded as the Response. Handle()
// is called on the loop thread and must not block on network I/O.
//
// ============================================================================

#pragma once

#include "convq/core/result.hpp"
#include "convq/engine/engine_error.hpp"
#include "convq/net/protocol.hpp"

#include <string_view>

namespace convq {

class RequestHandler {
   public:
    virtual ~RequestHandler() = default;

    virtual Result<Json, EngineError> Handle(std::string_view op_name, const Json& args) = 0;
};

}  // namespace convq
