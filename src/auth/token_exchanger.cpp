#include "cloudup/auth/token_exchanger.hpp"

#include "cloudup/core/format.hpp"

namespace cloudup::auth {

StaticTokenExchanger StaticTokenExchanger::basic(const std::string& username, const std::string& password) {
    return StaticTokenExchanger(base64_encode(username + ":" + password), "Basic");
}

} // namespace cloudup::auth
