#pragma once

#include "diagram.hh"

#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tsautils {
using namespace std;

enum class Format { dot, plantuml, mermaid };

optional<Format> parse_format(string const& name);
string format_name(Format f);

// spelling of a diagram language, all edges of all formats are printed with it
struct Notation {
  string start_node;    // initial pseudo-state
  string end_node;      // final pseudo-state
  string arrow;
  string label_prefix;
  string label_suffix;
  string terminator;
  string indent;
  function<string(string const&)> name;   // node names, verbatim if empty
  function<string(string const&)> label;  // edge labels, verbatim if empty
};

Notation const& dot_notation();
Notation const& plantuml_notation();
Notation const& mermaid_notation();

string format_endpoint(Notation const& n, Endpoint const& e);
string format_edge(Notation const& n, DiagramEdge const& e);

// quote string as DOT ID, unless it is a plain identifier or numeral already
string dot_id(string const& s);

// PlantUML and Mermaid can not quote a name in an edge. names that are not
// plain identifiers get an alias (state_0, state_1, ...) that is declared
// once as: state "some name" as state_0
bool is_plain_name(string const& s);
string uml_text(string const& s);  // for state descriptions and edge labels

class UmlAliases {
  vector<string> names;         // all node names, in order of appearance
  map<string, string> aliases;  // only for names that are not plain

public:
  explicit UmlAliases(Diagram const& d);

  string const& ref(string const& name) const;  // alias or name itself
  bool has_alias(string const& name) const { return map_has_key(aliases, name); }

  // "some name" as state_0, or just the name
  string declaration(string const& name) const;

  // aliased names that are none of the given ones, in order of appearance
  vector<string> undeclared(vector<string> const& declared) const;
};

// ----------------------------------------------------------------------------

// Graphviz. _initial_ is declared first and _final_ last (if used),
// so that the layout puts them at the conventional places.
class Dot {
  Diagram diag;

public:
  explicit Dot(Diagram d) : diag(move(d)) {}
  void print(ostream& out) const;
  string str() const;
};

// PlantUML state diagram, [*] is both start and end
class PlantUml {
  Diagram diag;

public:
  explicit PlantUml(Diagram d) : diag(move(d)) {}
  void print(ostream& out) const;
  string str() const;
};

// Mermaid stateDiagram-v2, [*] is both start and end
class Mermaid {
  Diagram diag;

public:
  explicit Mermaid(Diagram d) : diag(move(d)) {}
  void print(ostream& out) const;
  string str() const;
};

inline ostream& operator<<(ostream& out, Dot const& d) { d.print(out); return out; }
inline ostream& operator<<(ostream& out, PlantUml const& d) { d.print(out); return out; }
inline ostream& operator<<(ostream& out, Mermaid const& d) { d.print(out); return out; }

string render(Diagram const& d, Format f);

// A = Automaton, Dfa, Nfa or IntermediateAutomaton
template <typename A>
string to_dot(A const& aut) { return Dot(make_diagram(aut)).str(); }

template <typename A>
string to_plantuml(A const& aut) { return PlantUml(make_diagram(aut)).str(); }

template <typename A>
string to_mermaid(A const& aut) { return Mermaid(make_diagram(aut)).str(); }

}  // namespace tsautils
