#ifndef HFPULL_VERSION_HPP
#define HFPULL_VERSION_HPP

#include <string>

namespace hfpull {

const std::string HFPULL_VERSION_STRING = "1.2.0";
const int HFPULL_VERSION_MAJOR = 1;
const int HFPULL_VERSION_MINOR = 2;
const int HFPULL_VERSION_PATCH = 0;

} // namespace hfpull

#endif // HFPULL_VERSION_HPP
