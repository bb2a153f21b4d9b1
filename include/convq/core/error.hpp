// ============================================================================
// convq/core/error.hpp - Error Codes for convq
// ============================================================================
//
// Every failure in convq is a std::error_code in the "convq" category. The
// first block of codes is the engine's public taxonomy and is what clients
// see on the wire (by name, see ErrcName()). The second block covers the
// runtime underneath: event loop, sockets, storage.
//
// USAGE:
// ------
//   std::error_code ec = make_error_code(Errc::NotFound);
//   if (ec == Errc::NotFound) { ... }
//
// ============================================================================

#pragma once

#include <optional>
#include <string_view>
#include <system_error>

namespace convq {

enum class Errc {
    // Engine taxonomy
    ValidationError = 1,
    InvalidTransition,
    OutOfRange,
    InsufficientSpace,
    NotFound,
    Conflict,
    Internal,

    // Runtime / transport
    NoExecutor,
    IoError,
    BindFailed,
    ListenFailed,
    ConnectFailed,
    SendFailed,
    NotConnected,
    ProtocolError,
    FrameTooLarge,
    ReconnectExhausted,
    StorageUnavailable,
};

const std::error_category& ConvqCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// Stable identifier used in wire responses ("NotFound", "OutOfRange", ...)
std::string_view ErrcName(Errc e) noexcept;

// Inverse of ErrcName(); nullopt for names this build does not know
std::optional<Errc> ErrcFromName(std::string_view name) noexcept;

using Error = std::error_code;

}  // namespace convq

namespace std {
template <>
struct is_error_code_enum<convq::Errc> : true_type {};
}  // namespace std
