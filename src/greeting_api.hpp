#ifndef GREETING_API_HPP
#define GREETING_API_HPP

#include "http_request.hpp"
#include "http_response.hpp"

namespace greeting {

void greet(const http::request& req, http::response& res);

// Expects a JSON body with a non-empty "name".
void greetme(const http::request& req, http::response& res);

} // namespace greeting

#endif // GREETING_API_HPP
