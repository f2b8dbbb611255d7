#include "authenticator.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace ghack::server {

using namespace ghack::protocol;

AccountAuthenticator::AccountAuthenticator(const AuthConfig& auth, size_t max_players,
                                           PlayerCount online_players)
    : auth_(auth)
    , max_players_(max_players)
    , online_players_(std::move(online_players)) {
}

LoginVerdict AccountAuthenticator::verify(const LoginMsg& login) {
    if (login.name.empty()) {
        return LoginVerdict::reject(LoginReason::AccessDenied);
    }

    if (std::find(auth_.banned.begin(), auth_.banned.end(), login.name) != auth_.banned.end()) {
        std::cout << "[Auth] Banned name '" << login.name << "' refused" << std::endl;
        return LoginVerdict::reject(LoginReason::Banned);
    }

    if (online_players_ && online_players_() >= max_players_) {
        return LoginVerdict::reject(LoginReason::ServerFull);
    }

    auto account = std::find_if(auth_.accounts.begin(), auth_.accounts.end(),
                                [&](const AccountConfig& a) { return a.name == login.name; });
    if (account != auth_.accounts.end()) {
        if (!login.authtoken || *login.authtoken != account->authtoken) {
            std::cout << "[Auth] Bad token for '" << login.name << "'" << std::endl;
            return LoginVerdict::reject(LoginReason::AccessDenied);
        }
        return LoginVerdict::accept(login.permissions.value_or(account->permissions) & account->permissions);
    }

    if (auth_.require_auth) {
        std::cout << "[Auth] No account for '" << login.name << "'" << std::endl;
        return LoginVerdict::reject(LoginReason::AccessDenied);
    }
    return LoginVerdict::accept();
}

} // namespace ghack::server
