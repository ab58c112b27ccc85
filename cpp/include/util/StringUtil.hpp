#pragma once

/*
 * Various string utilities
 */
#include <string>
#include <vector>

namespace util {

/*
 * split(s) and split(s, t) behave just like s.split() and s.split(t), respectively, in python.
 */
std::vector<std::string> split(const std::string& s, const char* t = "");

// Similar to split(s, t), with some notable differences:
//
// - Writes the tokens to result instead of returning a new vector.
// - If the passed-in result is longer than the number of tokens, the excess entries in result are
//   left unchanged.
// - Returns the number of tokens found, which may be less than the size of result.
//
// Handy when called repeatedly with the same result vector, as when tokenizing every line of a
// file.
int split(std::vector<std::string>& result, const std::string& s, const char* t = "");

}  // namespace util

#include "inline/util/StringUtil.inl"
