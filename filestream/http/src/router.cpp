#include "filestream/router.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "filestream/http-constants.hpp"
#include "filestream/http-method.hpp"
#include "filestream/http-request.hpp"
#include "filestream/http-response.hpp"
#include "filestream/http-status-code.hpp"

namespace filestream {

namespace {

// Splits an absolute path into its segments, ignoring the leading slash and one trailing slash.
std::vector<std::string_view> SplitPath(std::string_view path) {
  std::vector<std::string_view> segments;
  if (path.starts_with('/')) {
    path.remove_prefix(1);
  }
  if (path.ends_with('/')) {
    path.remove_suffix(1);
  }
  if (path.empty()) {
    return segments;
  }
  while (true) {
    const auto slashPos = path.find('/');
    segments.push_back(path.substr(0, slashPos));
    if (slashPos == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slashPos + 1);
  }
  return segments;
}

std::string AllowHeaderValue(http::MethodBmp methods) {
  if (http::IsMethodSet(methods, http::Method::GET)) {
    methods = methods | http::Method::HEAD;
  }
  std::string ret;
  for (http::MethodIdx idx = 0; idx < http::kNbMethods; ++idx) {
    const auto method = http::MethodFromIdx(idx);
    if (http::IsMethodSet(methods, method)) {
      if (!ret.empty()) {
        ret.append(", ");
      }
      ret.append(http::MethodToStr(method));
    }
  }
  return ret;
}

}  // namespace

void Router::setDefault(RequestHandler handler) { _defaultHandler = std::move(handler); }

Router& Router::setPath(http::MethodBmp methods, std::string_view pattern, RequestHandler handler) {
  if (!pattern.starts_with('/')) {
    throw std::invalid_argument("Router path pattern should start with '/'");
  }
  if (methods == 0) {
    throw std::invalid_argument("Router path should be registered for at least one method");
  }
  std::vector<Segment> segments;
  for (const auto part : SplitPath(pattern)) {
    if (part.empty()) {
      throw std::invalid_argument("Router path pattern cannot contain empty segments");
    }
    if (part.front() == '{') {
      if (part.size() < 3 || part.back() != '}') {
        throw std::invalid_argument("Router path parameter should be of the form {name}");
      }
      segments.push_back(Segment{std::string(part.substr(1, part.size() - 2)), true});
    } else {
      segments.push_back(Segment{std::string(part), false});
    }
  }

  auto it = std::ranges::find_if(_routes, [&segments](const Route& route) {
    return std::ranges::equal(route.segments, segments, [](const Segment& lhs, const Segment& rhs) {
      return lhs.isParam == rhs.isParam && (lhs.isParam || lhs.value == rhs.value);
    });
  });
  if (it == _routes.end()) {
    it = _routes.insert(_routes.end(), Route{std::move(segments), {}, {}});
  }
  it->methods = it->methods | methods;
  for (http::MethodIdx idx = 0; idx < http::kNbMethods; ++idx) {
    if (http::IsMethodSet(methods, http::MethodFromIdx(idx))) {
      it->handlers[idx] = handler;
    }
  }
  return *this;
}

Router::RoutingResult Router::match(http::Method method, std::string_view path) const {
  RoutingResult result;
  const auto pathSegments = SplitPath(path);
  for (const auto& route : _routes) {
    if (route.segments.size() != pathSegments.size()) {
      continue;
    }
    HttpRequest::PathParams params;
    bool matched = true;
    for (std::size_t pos = 0; pos < pathSegments.size(); ++pos) {
      const auto& segment = route.segments[pos];
      if (segment.isParam) {
        if (pathSegments[pos].empty()) {
          matched = false;
          break;
        }
        params.emplace_back(segment.value, pathSegments[pos]);
      } else if (segment.value != pathSegments[pos]) {
        matched = false;
        break;
      }
    }
    if (!matched) {
      continue;
    }
    result.allowedMethods = route.methods;
    auto methodIdx = http::MethodToIdx(method);
    if (!route.handlers[methodIdx] && method == http::Method::HEAD) {
      methodIdx = http::MethodToIdx(http::Method::GET);
    }
    if (route.handlers[methodIdx]) {
      result.handler = &route.handlers[methodIdx];
      result.pathParams = std::move(params);
    }
    return result;
  }
  if (_defaultHandler) {
    result.handler = &_defaultHandler;
  }
  return result;
}

HttpResponse Router::dispatch(HttpRequest& request) const {
  auto routingResult = match(request.method(), request.path());
  if (routingResult.handler != nullptr) {
    request.setPathParams(std::move(routingResult.pathParams));
    return (*routingResult.handler)(request);
  }
  if (routingResult.allowedMethods != 0) {
    return HttpResponse(http::StatusCodeMethodNotAllowed, http::ReasonMethodNotAllowed)
        .header(http::Allow, AllowHeaderValue(routingResult.allowedMethods));
  }
  return HttpResponse(http::StatusCodeNotFound, http::ReasonNotFound);
}

}  // namespace filestream
