#include "filestream/http-method.hpp"

#include <optional>
#include <string_view>

#include "filestream/http-constants.hpp"

namespace filestream::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) noexcept {
  switch (str.size()) {
    case 3:  // GET, PUT
      if (str == GET) {
        return Method::GET;
      }
      if (str == PUT) {
        return Method::PUT;
      }
      return std::nullopt;
    case 4:  // HEAD, POST
      if (str == HEAD) {
        return Method::HEAD;
      }
      if (str == POST) {
        return Method::POST;
      }
      return std::nullopt;
    case 5:
      return str == PATCH ? std::optional<Method>(Method::PATCH) : std::nullopt;
    case 6:
      return str == DELETE ? std::optional<Method>(Method::DELETE) : std::nullopt;
    case 7:
      return str == OPTIONS ? std::optional<Method>(Method::OPTIONS) : std::nullopt;
    default:
      return std::nullopt;
  }
}

}  // namespace filestream::http
