#include <routetrie/router.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string_view>

using namespace routetrie;

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <path>...\n";
    return EXIT_FAILURE;
  }

  Router<std::string_view> router;

  try {
    router.insert("/", "home");
    router.insert("/about", "about");
    router.insert("/users/new", "new user form");
    router.insert("/users/{id}", "user profile");
    router.insert("/users/{id}/posts/{postId}", "user post");
    router.insert("/static/{*filepath}", "static file");
    router.insert("/set/{{literal}}", "escaped braces");
  } catch (const std::exception &e) {
    std::cerr << "Route registration failed: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  int nbMisses = 0;
  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view path(argv[argPos]);
    const auto res = router.match(path);
    if (!res) {
      std::cout << path << " -> no route\n";
      ++nbMisses;
      continue;
    }
    std::cout << path << " -> " << res->value() << '\n';
    for (const auto [key, value] : res->params) {
      std::cout << "  " << key << " = " << value << '\n';
    }
  }

  return nbMisses == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
