// Blackbody exceptions header

#ifndef EXCEPTIONS_H_
#define EXCEPTIONS_H_

// C++ headers
#include <iostream>   // cerr
#include <stdexcept>  // runtime_error
#include <string>     // string

//--------------------------------------------------------------------------------------------------

// Blackbody exception
struct BlackbodyException
  : std::runtime_error
{
  explicit BlackbodyException(const char *message)
    : std::runtime_error::runtime_error(ComposeMessage(message)) {}
  static std::string ComposeMessage(const char *message)
  {
    std::string message_str(message);
    message_str.insert(0, "Error: ");
    message_str.append("\n");
    return message_str;
  }
};

//--------------------------------------------------------------------------------------------------

// Blackbody exception for allocations that cannot be satisfied
struct BlackbodyResourceException
  : BlackbodyException
{
  explicit BlackbodyResourceException(const char *message)
    : BlackbodyException(message) {}
};

//--------------------------------------------------------------------------------------------------

// Blackbody warning
struct BlackbodyWarning
{
  explicit BlackbodyWarning(const char *message)
  {
    std::string message_str(message);
    message_str.insert(0, "Warning: ");
    message_str.append("\n");
    std::cerr << message_str;
  }
};

#endif
