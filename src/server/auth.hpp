/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Auth - Session and identity derived from request headers
 *
 * The front end has no session store of its own. A request carrying the
 * configured session cookie counts as having used its session, and one
 * carrying an Authorization header counts as authenticated.
 */

#ifndef PAGESTASH_SERVER_AUTH_HPP
#define PAGESTASH_SERVER_AUTH_HPP

#include "config/config.hpp"
#include "pipeline/request.hpp"

#include <string>

namespace pagestash::server {

class CookieSession : public pipeline::Session {
public:
    explicit CookieSession(bool present) : present_(present) {}

    bool accessed() const override { return present_; }

private:
    bool present_;
};

class HeaderIdentity : public pipeline::Identity {
public:
    explicit HeaderIdentity(bool authenticated) : authenticated_(authenticated) {}

    bool is_authenticated() const override { return authenticated_; }

private:
    bool authenticated_;
};

/**
 * True if the Cookie header carries a cookie named `name`
 */
bool has_cookie(const pipeline::Request& request, const std::string& name);

/**
 * Attach session and identity to `request`; no-op unless auth is enabled
 */
void attach_auth(pipeline::Request& request, const config::AuthSettings& settings);

} // namespace pagestash::server

#endif // PAGESTASH_SERVER_AUTH_HPP
