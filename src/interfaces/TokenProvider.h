/**
 * @file TokenProvider.h
 * @brief PetLink::TokenProvider - Session token source
 * @version 1.0.0
 *
 * Login and refresh live outside the library. The HTTP driver asks for a
 * token before every request.
 */
#pragma once
#include <string>

namespace PetLink {

class TokenProvider {
public:
  virtual ~TokenProvider() = default;

  /**
   * @brief Current bearer token
   * @param out Token value
   * @return false if no valid session exists
   */
  virtual bool token(std::string &out) = 0;
};

} // namespace PetLink
