#include "cli/Commands.hpp"

#include <QCoreApplication>
#include <iostream>

int main(int argc, char *argv[]) {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("sten");
  QCoreApplication::setApplicationVersion("1.0");

  return sten::cli::run(QCoreApplication::arguments(), std::cout, std::cerr);
}
