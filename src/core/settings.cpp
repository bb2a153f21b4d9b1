// ============================================================================
// convq/core/settings.cpp - Key/Value Settings Store
// ============================================================================

#include "convq/core/settings.hpp"

#include "convq/core/error.hpp"
#include "convq/core/logging.hpp"

#include <cctype>
#include <charconv>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace convq {

namespace {

std::string_view Trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

std::string Lower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

}  // namespace

// ============================================================================
// MemorySettingsStore
// ============================================================================

std::optional<std::string> MemorySettingsStore::Get(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

Result<void, std::error_code> MemorySettingsStore::Put(std::string_view key, std::string value) {
    if (key.empty()) return Err(make_error_code(Errc::ValidationError));
    std::lock_guard<std::mutex> lock(mutex_);
    values_.insert_or_assign(std::string(key), std::move(value));
    return Ok();
}

std::vector<std::pair<std::string, std::string>> MemorySettingsStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {values_.begin(), values_.end()};
}

// ============================================================================
// FileSettingsStore
// ============================================================================

Result<std::unique_ptr<FileSettingsStore>, std::error_code> FileSettingsStore::Open(std::filesystem::path path) {
    auto store = std::unique_ptr<FileSettingsStore>(new FileSettingsStore(std::move(path)));
    if (auto ec = store->Load()) {
        return Err(ec);
    }
    return Ok(std::move(store));
}

std::error_code FileSettingsStore::Load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return ec ? make_error_code(Errc::IoError) : std::error_code{};
    }

    std::ifstream in(path_);
    if (!in) return make_error_code(Errc::IoError);

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto text = Trim(line);
        if (text.empty() || text.front() == '#') continue;

        auto eq = text.find('=');
        if (eq == std::string_view::npos) {
            CONVQ_LOG_WARN("settings", path_.string() << ":" << line_no << ": ignoring line without '='");
            continue;
        }
        auto key = Trim(text.substr(0, eq));
        auto value = Trim(text.substr(eq + 1));
        if (key.empty()) continue;
        values_.insert_or_assign(std::string(key), std::string(value));
    }
    return {};
}

std::error_code FileSettingsStore::Flush() const {
    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return make_error_code(Errc::IoError);
        for (const auto& [key, value] : values_) {
            out << key << '=' << value << '\n';
        }
        out.flush();
        if (!out) return make_error_code(Errc::IoError);
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        CONVQ_LOG_ERROR("settings", "rename " << tmp.string() << " failed: " << ec.message());
        return make_error_code(Errc::IoError);
    }
    return {};
}

std::optional<std::string> FileSettingsStore::Get(std::string_view key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

Result<void, std::error_code> FileSettingsStore::Put(std::string_view key, std::string value) {
    if (key.empty() || key.find('=') != std::string_view::npos || value.find('\n') != std::string::npos) {
        return Err(make_error_code(Errc::ValidationError));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto previous = values_.find(key);
    std::optional<std::string> old_value;
    if (previous != values_.end()) old_value = previous->second;

    values_.insert_or_assign(std::string(key), std::move(value));
    if (auto ec = Flush()) {
        // Keep memory consistent with what is on disk
        if (old_value) {
            values_.insert_or_assign(std::string(key), std::move(*old_value));
        } else {
            values_.erase(std::string(key));
        }
        return Err(ec);
    }
    return Ok();
}

std::vector<std::pair<std::string, std::string>> FileSettingsStore::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {values_.begin(), values_.end()};
}

// ============================================================================
// Settings
// ============================================================================

bool Settings::GetBool(std::string_view key, bool fallback) const {
    auto raw = store_.Get(key);
    if (!raw) return fallback;

    auto value = Lower(Trim(*raw));
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;

    CONVQ_LOG_WARN("settings", "'" << key << "' is not a boolean (" << *raw << "), using default");
    return fallback;
}

int64_t Settings::GetInt(std::string_view key, int64_t fallback) const {
    auto raw = store_.Get(key);
    if (!raw) return fallback;

    auto text = Trim(*raw);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        CONVQ_LOG_WARN("settings", "'" << key << "' is not an integer (" << *raw << "), using default");
        return fallback;
    }
    return value;
}

double Settings::GetDouble(std::string_view key, double fallback) const {
    auto raw = store_.Get(key);
    if (!raw) return fallback;

    std::string text(Trim(*raw));
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
        CONVQ_LOG_WARN("settings", "'" << key << "' is not a number (" << *raw << "), using default");
        return fallback;
    }
    return value;
}

std::string Settings::GetString(std::string_view key, std::string fallback) const {
    auto raw = store_.Get(key);
    if (!raw) return fallback;
    return *raw;
}

Result<void, std::error_code> Settings::SetBool(std::string_view key, bool value) {
    return store_.Put(key, value ? "true" : "false");
}

Result<void, std::error_code> Settings::SetInt(std::string_view key, int64_t value) {
    return store_.Put(key, std::to_string(value));
}

Result<void, std::error_code> Settings::SetDouble(std::string_view key, double value) {
    std::ostringstream out;
    out.precision(17);
    out << value;
    return store_.Put(key, out.str());
}

Result<void, std::error_code> Settings::SetString(std::string_view key, std::string value) {
    return store_.Put(key, std::move(value));
}

}  // namespace convq
