// ============================================================================
// convq/core/error.cpp - Error Category Implementation
// ============================================================================

#include "convq/core/error.hpp"

#include <array>
#include <string>
#include <utility>

namespace convq {

namespace {

constexpr std::array<std::pair<Errc, std::string_view>, 18> kErrcNames{{
    {Errc::ValidationError, "ValidationError"},
    {Errc::InvalidTransition, "InvalidTransition"},
    {Errc::OutOfRange, "OutOfRange"},
    {Errc::InsufficientSpace, "InsufficientSpace"},
    {Errc::NotFound, "NotFound"},
    {Errc::Conflict, "Conflict"},
    {Errc::Internal, "Internal"},
    {Errc::NoExecutor, "NoExecutor"},
    {Errc::IoError, "IoError"},
    {Errc::BindFailed, "BindFailed"},
    {Errc::ListenFailed, "ListenFailed"},
    {Errc::ConnectFailed, "ConnectFailed"},
    {Errc::SendFailed, "SendFailed"},
    {Errc::NotConnected, "NotConnected"},
    {Errc::ProtocolError, "ProtocolError"},
    {Errc::FrameTooLarge, "FrameTooLarge"},
    {Errc::ReconnectExhausted, "ReconnectExhausted"},
    {Errc::StorageUnavailable, "StorageUnavailable"},
}};

class ConvqCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "convq"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::ValidationError:
                return "Invalid request";
            case Errc::InvalidTransition:
                return "Transition not allowed from the current status";
            case Errc::OutOfRange:
                return "Value out of range";
            case Errc::InsufficientSpace:
                return "Insufficient storage space";
            case Errc::NotFound:
                return "Not found";
            case Errc::Conflict:
                return "Conflicting state";
            case Errc::Internal:
                return "Internal error";
            case Errc::NoExecutor:
                return "No current executor";
            case Errc::IoError:
                return "I/O error";
            case Errc::BindFailed:
                return "Failed to bind";
            case Errc::ListenFailed:
                return "Failed to listen";
            case Errc::ConnectFailed:
                return "Failed to connect";
            case Errc::SendFailed:
                return "Failed to send data";
            case Errc::NotConnected:
                return "Not connected";
            case Errc::ProtocolError:
                return "Malformed protocol message";
            case Errc::FrameTooLarge:
                return "Frame exceeds maximum size";
            case Errc::ReconnectExhausted:
                return "All reconnect attempts exhausted";
            case Errc::StorageUnavailable:
                return "Storage root unavailable";
            default:
                return "Unknown convq error";
        }
    }
};

}  // namespace

const std::error_category& ConvqCategory() noexcept {
    static const ConvqCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), ConvqCategory()};
}

std::string_view ErrcName(Errc e) noexcept {
    for (const auto& [code, name] : kErrcNames) {
        if (code == e) return name;
    }
    return "Unknown";
}

std::optional<Errc> ErrcFromName(std::string_view name) noexcept {
    for (const auto& [code, code_name] : kErrcNames) {
        if (code_name == name) return code;
    }
    return std::nullopt;
}

}  // namespace convq
