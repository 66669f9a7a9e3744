// Basic types shared between the core clients and the transfer service.
// Keep these structures plain so they can cross thread boundaries cheaply.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>

namespace ferry {

// known_hosts validation policy for the server key.
enum class KnownHostsPolicy {
    Strict,     // Requires an exact match in known_hosts.
    AcceptNew,  // TOFU: accept and store new hosts; reject key changes.
    Off         // No verification (not recommended).
};

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (when known)
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
};

// Answers keyboard-interactive prompts.
// Must return true and fill "responses" with one element per prompt.
// When it returns false the backend falls back to a user/password heuristic.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    // Return true to accept and store, false to reject.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    // Custom keyboard-interactive handling (OTP/2FA). Optional.
    KbdIntPromptsCB keyboard_interactive_cb;

    // Transport tuning. 0 = let the caller (service settings) decide.
    int connect_timeout_ms = 0;
    int keepalive_interval_s = 0;
};

// Pool identity of a session: "host:port:username". The auth variant is
// deliberately not part of the key.
inline std::string endpointKey(const SessionOptions& opt) {
    const std::uint16_t port = opt.port ? opt.port : 22;
    return opt.host + ":" + std::to_string(port) + ":" + opt.username;
}

} // namespace ferry
