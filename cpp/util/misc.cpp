#include "util/misc.hpp"

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setUint(uint32_t& var) {
  return [&var](kj::StringPtr p) {
    var = std::stoul(std::string(p));
    return true;
  };
};

std::function<bool(kj::StringPtr)> appendList(std::vector<std::string>& var) {
  return [&var](kj::StringPtr p) {
    split(std::string(p), ',', std::back_inserter(var));
    return true;
  };
}

std::function<bool(kj::StringPtr)> appendString(
    std::vector<std::string>& var) {
  return [&var](kj::StringPtr p) {
    var.emplace_back(p.cStr());
    return true;
  };
}

}  // namespace util
