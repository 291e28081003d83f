#pragma once

#include <algorithm>
#include <iostream>
#include <iterator>
#include <vector>
#include <map>
#include <set>
#include <string>
#include <sstream>
#include <cassert>

// is sorted + unique vector?
template<typename T>
bool is_set_vec(std::vector<T> const& v) {
  return std::adjacent_find(std::cbegin(v), std::cend(v),
      [](T const& a, T const& b){ return !(a < b); }) == std::cend(v);
}

// print anything that has an operator<<
template<typename T>
std::string to_str(T const& val) {
  std::stringstream ss;
  ss << val;
  return ss.str();
}

// arbitrary sequence (with iterators) to string, intercalated with separator
template<typename T>
std::string seq_to_str(T const& s, std::string const& sep=",") {
  std::stringstream ss;
  for (auto it = std::cbegin(s); it!=std::cend(s); ++it) {
    if (it != std::cbegin(s))
      ss << sep;
    ss << *it;
  }
  return ss.str();
}

template<typename T>
inline std::vector<T> set_diff(std::vector<T> const& v,
                               std::vector<T> const& w) {
  assert(is_set_vec(v)); assert(is_set_vec(w));
  std::vector<T> ret;
  std::set_difference(std::cbegin(v), std::cend(v),
                      std::cbegin(w), std::cend(w), std::back_inserter(ret));
  return ret;
}

// check whether a map has a key using .find()
template <template<typename,typename,typename...> class M, typename K, typename V, typename ... A>
inline bool map_has_key(M<K,V,A...> const& m, K const& k) {
  return m.find(k) != end(m);
}

// check whether a container has a value using .find()
template <typename C, typename V>
inline bool contains(C const& c, V const& v) {
  return std::find(std::cbegin(c), std::cend(c), v) != std::cend(c);
}

// check whether a std::set (or map) has a key in log time
template <typename K, typename ... A>
inline bool contains(std::set<K,A...> const& s, K const& k) {
  return s.find(k) != s.end();
}

// visitor built from lambdas, for std::visit
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
