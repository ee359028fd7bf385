#include "camlink/cli/router.hpp"

int main(int argc, char** argv) {
  return camlink::cli::Dispatch(argc, argv);
}
