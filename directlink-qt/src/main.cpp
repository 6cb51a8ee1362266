/**
 * @file main.cpp
 * @brief DirectLink Qt Application Entry Point
 */

#include "mainwindow.h"
#include <QApplication>
#include <QStyleFactory>
#include <directlink/directlink.h>

int main(int argc, char *argv[]) {
  QApplication app(argc, argv);

  // Application metadata
  app.setApplicationName("DirectLink");
  app.setApplicationVersion(directlink::VERSION_STRING);
  app.setOrganizationName("DirectLink");

  // Use Fusion style for consistent cross-platform look
  app.setStyle(QStyleFactory::create("Fusion"));

  MainWindow window;
  window.show();

  return app.exec();
}
