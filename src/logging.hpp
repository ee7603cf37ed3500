#ifndef LOGGING_HPP
#define LOGGING_HPP

#include "version.hpp"
#include <ctime>
#include <iostream>
#include <map>
#include <string>

namespace pgs_match {

inline void printHeader(const std::string &toolName,
                        const std::string &description,
                        const std::map<std::string, std::string> &files,
                        const std::map<std::string, std::string> &parameters) {
  std::time_t now = std::time(nullptr);
  char timestr[100];
  std::strftime(timestr, sizeof(timestr), "%d/%m/%Y - %H:%M:%S",
                std::localtime(&now));

  std::cerr << "\n[" << toolName << "] " << description
            << "\n  * Version       : " << getFullVersion()
            << "\n  * Run date      : " << timestr << "\n"
            << std::endl;

  if (!files.empty()) {
    std::cerr << "Files:" << std::endl;
    for (const auto &pair : files) {
      if (!pair.second.empty()) {
        std::cerr << "  * " << pair.first;
        std::string padding(
            pair.first.length() < 14 ? 14 - pair.first.length() : 1, ' ');
        std::cerr << padding << ": [" << pair.second << "]" << std::endl;
      }
    }
    std::cerr << std::endl;
  }

  if (!parameters.empty()) {
    std::cerr << "Parameters:" << std::endl;
    for (const auto &pair : parameters) {
      std::cerr << "  * " << pair.first;
      std::string padding(
          pair.first.length() < 14 ? 14 - pair.first.length() : 1, ' ');
      std::cerr << padding << ": " << pair.second << std::endl;
    }
    std::cerr << std::endl;
  }
}

inline void log(const std::string &message) {
  std::cerr << "[LOG] " << message << std::endl;
}

inline void warn(const std::string &message) {
  std::cerr << "[WARNING] " << message << std::endl;
}

} // namespace pgs_match

#endif // LOGGING_HPP
