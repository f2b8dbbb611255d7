#pragma once

#include "protocol/protocol.hpp"
#include "game_config.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>

namespace ghack::server {

struct LoginVerdict {
    bool accepted = false;
    protocol::LoginReason reason = protocol::LoginReason::AccessDenied;  // Only meaningful when rejected
    uint32_t permissions = 0;  // Granted bits, only meaningful when accepted

    static LoginVerdict accept(uint32_t permissions = 0) {
        return {true, protocol::LoginReason::Accepted, permissions};
    }
    static LoginVerdict reject(protocol::LoginReason reason) { return {false, reason, 0}; }
};

// Credential authority consulted while handling Login
class Authenticator {
public:
    virtual ~Authenticator() = default;
    virtual LoginVerdict verify(const protocol::LoginMsg& login) = 0;
};

// Checks logins against the accounts and bans from accounts.json and the
// configured player limit. Accounts are granted the requested permission bits
// that their entry allows (all of them if none were requested); guests get none.
class AccountAuthenticator : public Authenticator {
public:
    using PlayerCount = std::function<size_t()>;

    AccountAuthenticator(const AuthConfig& auth, size_t max_players, PlayerCount online_players);

    LoginVerdict verify(const protocol::LoginMsg& login) override;

private:
    const AuthConfig& auth_;
    size_t max_players_;
    PlayerCount online_players_;
};

} // namespace ghack::server
