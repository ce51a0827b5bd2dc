#pragma once

#include <array>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "filestream/http-method.hpp"
#include "filestream/http-request.hpp"
#include "filestream/http-response.hpp"

namespace filestream {

class Router {
 public:
  // Request handler type: receives a const HttpRequest& and returns an HttpResponse.
  using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

  struct RoutingResult {
    // nullptr if no handler is registered for this path and method
    const RequestHandler* handler{nullptr};
    HttpRequest::PathParams pathParams;
    // Methods registered for the matched path (0 if no path matched)
    http::MethodBmp allowedMethods{};
  };

  Router() = default;

  // Register a fallback handler invoked when no path pattern matches.
  // Without it, unmatched paths are answered with 404.
  void setDefault(RequestHandler handler);

  // Register a handler for an absolute path and a set of HTTP methods.
  // Path segments of the form '{name}' capture one non-empty segment, retrievable with
  // HttpRequest::pathParamValue(name). Example: "/stream/{id}" matches "/stream/42" with id=42.
  // A trailing slash in the request path is ignored.
  // Routes are tried in registration order. Throws std::invalid_argument on malformed patterns.
  Router& setPath(http::MethodBmp methods, std::string_view pattern, RequestHandler handler);

  Router& setPath(http::Method method, std::string_view pattern, RequestHandler handler) {
    return setPath(static_cast<http::MethodBmp>(method), pattern, std::move(handler));
  }

  // Finds the handler for given method and path.
  // HEAD requests fall back on the GET handler if no HEAD handler is registered.
  [[nodiscard]] RoutingResult match(http::Method method, std::string_view path) const;

  // Matches the request, stores captured path parameters in it and invokes the handler.
  // Unknown paths give 404 (or the default handler), known paths with another method give 405 with 'Allow'.
  [[nodiscard]] HttpResponse dispatch(HttpRequest& request) const;

 private:
  struct Segment {
    std::string value;  // literal value, or parameter name
    bool isParam{false};
  };

  struct Route {
    std::vector<Segment> segments;
    http::MethodBmp methods{};
    std::array<RequestHandler, http::kNbMethods> handlers;
  };

  std::vector<Route> _routes;
  RequestHandler _defaultHandler;
};

}  // namespace filestream
