/*!
  \file ifx_extract.cpp
  \brief Точка входа ifx-extract.
*/

#include "../include/service_controller.hpp"

int main(int argc, char** argv) {
  ServiceController controller;
  return controller.run(argc, argv);
}
