#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include "spindle/extract.hpp"
#include "spindle/http-headers.hpp"
#include "spindle/http-method.hpp"
#include "spindle/http-request.hpp"
#include "spindle/http-response.hpp"
#include "spindle/http-status-code.hpp"
#include "spindle/into-response.hpp"
#include "spindle/method-router.hpp"
#include "spindle/path-params.hpp"
#include "spindle/request-body.hpp"
#include "spindle/router-config.hpp"
#include "spindle/router.hpp"

using namespace spindle;

namespace {

std::string GetUser(PathParams params) { return "user " + std::string(params.get("id").value_or("?")); }

auto CreateUser(std::string body) {
  return std::pair{http::StatusCodeCreated, "created user " + body};
}

auto DeleteUser(PathParams params) {
  return std::tuple{http::StatusCodeOK, ResponseHeader{"X-Deleted", std::string(params.get("id").value_or(""))},
                    std::string_view("deleted")};
}

void Print(const Router &router, http::Method method, std::string_view target, std::string body = {}) {
  HttpResponse resp = router.call(HttpRequest(method, target, HttpHeaders{}, RequestBody(std::move(body))));
  std::cout << http::MethodToStr(method) << ' ' << target << " -> " << resp.status();
  for (const auto &[name, value] : resp.headers()) {
    std::cout << " [" << name << ": " << value << ']';
  }
  if (resp.hasBody()) {
    std::cout << " \"" << resp.body() << '"';
  }
  std::cout << '\n';
}

}  // namespace

int main() {
  try {
    Router router =
        RouterBuilder(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Redirect))
            .route("/", [] { return "Hello from spindle!"; })
            .route("/users", Post(CreateUser))
            .route("/users/:id", Get(GetUser).del(DeleteUser))
            .route("/files/*path",
                   Get([](const HttpRequest &req) { return std::string(req.pathParam("path").value_or("")); }))
            .fallback([](http::Method method) {
              return std::pair{http::StatusCodeNotFound,
                               std::string("nothing here for ") + std::string(http::MethodToStr(method))};
            })
            .build();

    Print(router, http::Method::GET, "/");
    Print(router, http::Method::POST, "/users", "alice");
    Print(router, http::Method::GET, "/users/42");
    Print(router, http::Method::DELETE, "/users/42");
    Print(router, http::Method::PUT, "/users/42");
    Print(router, http::Method::GET, "/users/42/?verbose=1");
    Print(router, http::Method::GET, "/files/docs/readme.md");
    Print(router, http::Method::GET, "/unknown");
  } catch (const std::exception &e) {
    std::cerr << "Router setup error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
