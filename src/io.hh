#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <variant>

#include <spdlog/spdlog.h>

#include "aut.hh"
#include "intermediate.hh"

namespace tsautils {

using namespace std;

// write text to file (created or truncated).
// failure -> std::system_error with the errno of the failed operation
void write_file(string const& path, string const& text,
                shared_ptr<spdlog::logger> log = nullptr);

// an automaton read from a textual description
using Description = variant<Automaton<string, string>,
                            IntermediateAutomaton<string, string>>;

// line based description, '#' starts a comment. first directive is the kind:
//
//   automaton                    intermediate
//   state NAME                   state NAME
//   initial NAME                 choice NAME
//   final NAME                   edge SRC SYM DST      (SRC may be '*')
//   edge SRC SYM DST             branch SRC SYM DST DST ...
//
// DST of intermediate automata: NAME, NAME:LABEL, end, end:LABEL
// (end = final pseudo-state, LABEL = label override).
// malformed input -> std::runtime_error naming the line
Description read_automaton(istream& in, shared_ptr<spdlog::logger> log = nullptr);

// same, from file (or stdin for empty filename).
// unreadable file -> std::system_error
Description read_automaton_file(string const& filename,
                                shared_ptr<spdlog::logger> log = nullptr);

}  // namespace tsautils
