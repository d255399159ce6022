/**
 * @file HttpEndpoint.hpp
 * @brief Splits service URLs into an httplib origin and a path prefix.
 */

#pragma once
#include <string>

namespace clara::infrastructure {

/**
 * @struct HttpEndpoint
 * @brief "http://host:8080/v1/" becomes origin "http://host:8080" and basePath "/v1".
 */
struct HttpEndpoint {
    std::string origin;
    std::string basePath;

    /** @brief Parses a URL; a missing scheme defaults to http. */
    static HttpEndpoint Parse(const std::string& url);

    std::string path(const std::string& suffix) const { return basePath + suffix; }
};

} // namespace clara::infrastructure
