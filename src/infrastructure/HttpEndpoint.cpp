/**
 * @file HttpEndpoint.cpp
 * @brief Implementation of HttpEndpoint.
 */

#include "infrastructure/HttpEndpoint.hpp"

namespace clara::infrastructure {

HttpEndpoint HttpEndpoint::Parse(const std::string& url) {
    std::string trimmed = url;
    while (!trimmed.empty() && (trimmed.back() == '/' || trimmed.back() == ' ')) {
        trimmed.pop_back();
    }
    if (trimmed.find("://") == std::string::npos) {
        trimmed = "http://" + trimmed;
    }

    HttpEndpoint endpoint;
    size_t hostStart = trimmed.find("://") + 3;
    size_t slash = trimmed.find('/', hostStart);
    if (slash == std::string::npos) {
        endpoint.origin = trimmed;
    } else {
        endpoint.origin = trimmed.substr(0, slash);
        endpoint.basePath = trimmed.substr(slash);
    }
    return endpoint;
}

} // namespace clara::infrastructure
