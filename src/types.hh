#pragma once

#include <functional>
#include <iostream>
#include <utility>

namespace tsautils {
using namespace std;

// automaton state, identified by a caller-supplied value
template <typename T>
struct State {
  T id;

  State() = default;
  State(T const& v) : id(v) {}

  T const& get() const { return id; }

  bool operator==(State const& o) const { return id == o.id; }
  bool operator!=(State const& o) const { return !(id == o.id); }
  bool operator<(State const& o) const { return id < o.id; }
};

// transition symbol (or function name) of an automaton
template <typename T>
struct Symbol {
  T id;

  Symbol() = default;
  Symbol(T const& v) : id(v) {}

  T const& get() const { return id; }

  bool operator==(Symbol const& o) const { return id == o.id; }
  bool operator!=(Symbol const& o) const { return !(id == o.id); }
  bool operator<(Symbol const& o) const { return id < o.id; }
};

template <typename T>
ostream& operator<<(ostream& os, State<T> const& s) { return os << s.id; }
template <typename T>
ostream& operator<<(ostream& os, Symbol<T> const& s) { return os << s.id; }

}  // namespace tsautils

namespace std {
template <typename T>
struct hash<tsautils::State<T>> {
  size_t operator()(tsautils::State<T> const& s) const { return hash<T>()(s.id); }
};
template <typename T>
struct hash<tsautils::Symbol<T>> {
  size_t operator()(tsautils::Symbol<T> const& s) const { return hash<T>()(s.id); }
};
}  // namespace std
