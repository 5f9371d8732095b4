#include "app/Cli.hpp"

#include <cstdio>
#include <iostream>

int main(int argc, char** argv) {
  return getcputime::app::run_main(argc, argv, std::cout, stderr);
}
