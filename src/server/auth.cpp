/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Auth implementation
 */

#include "server/auth.hpp"

#include <memory>
#include <string_view>

namespace pagestash::server {

bool has_cookie(const pipeline::Request& request, const std::string& name) {
    auto cookies = request.meta("HTTP_COOKIE");
    if (!cookies || name.empty()) {
        return false;
    }

    std::string_view rest(*cookies);
    while (!rest.empty()) {
        auto semi = rest.find(';');
        auto pair = rest.substr(0, semi);
        rest = semi == std::string_view::npos ? std::string_view{} : rest.substr(semi + 1);

        auto start = pair.find_first_not_of(' ');
        if (start == std::string_view::npos) {
            continue;
        }
        pair = pair.substr(start);
        auto eq = pair.find('=');
        auto cookie_name = pair.substr(0, eq);
        while (!cookie_name.empty() && cookie_name.back() == ' ') {
            cookie_name.remove_suffix(1);
        }
        if (cookie_name == name) {
            return true;
        }
    }
    return false;
}

void attach_auth(pipeline::Request& request, const config::AuthSettings& settings) {
    if (!settings.enabled) {
        return;
    }

    request.session = std::make_shared<CookieSession>(has_cookie(request, settings.session_cookie));
    request.user = std::make_shared<HeaderIdentity>(request.meta("HTTP_AUTHORIZATION").has_value());
}

} // namespace pagestash::server
