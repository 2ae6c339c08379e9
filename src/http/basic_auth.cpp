#include "graphlink/http/basic_auth.hpp"
#include <openssl/evp.h>
#include <vector>

namespace graphlink {
namespace http {

std::string base64_encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }

    // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a terminating NUL
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const int len = EVP_EncodeBlock(out.data(),
                                    reinterpret_cast<const unsigned char*>(data.data()),
                                    static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
}

std::string basic_authorization(std::string_view username, std::string_view password) {
    std::string credentials;
    credentials.reserve(username.size() + password.size() + 1);
    credentials.append(username);
    credentials.push_back(':');
    credentials.append(password);
    return "Basic " + base64_encode(credentials);
}

} // namespace http
} // namespace graphlink
