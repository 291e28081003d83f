#include "export.hh"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

using namespace std;

namespace tsautils {

optional<Format> parse_format(string const& name) {
  if (name == "dot" || name == "graphviz")
    return Format::dot;
  if (name == "plantuml" || name == "puml")
    return Format::plantuml;
  if (name == "mermaid")
    return Format::mermaid;
  return nullopt;
}

string format_name(Format f) {
  switch (f) {
    case Format::dot: return "dot";
    case Format::plantuml: return "plantuml";
    case Format::mermaid: return "mermaid";
  }
  throw logic_error("unhandled diagram format");
}

bool Diagram::uses_initial() const {
  return any_of(cbegin(edges), cend(edges), [](DiagramEdge const& e){
      return e.source.kind == Endpoint::Kind::initial_pseudo
          || e.destination.kind == Endpoint::Kind::initial_pseudo;
  });
}

bool Diagram::uses_final() const {
  return any_of(cbegin(edges), cend(edges), [](DiagramEdge const& e){
      return e.source.kind == Endpoint::Kind::final_pseudo
          || e.destination.kind == Endpoint::Kind::final_pseudo;
  });
}

string format_endpoint(Notation const& n, Endpoint const& e) {
  switch (e.kind) {
    case Endpoint::Kind::initial_pseudo: return n.start_node;
    case Endpoint::Kind::final_pseudo: return n.end_node;
    case Endpoint::Kind::state: return n.name ? n.name(e.name) : e.name;
  }
  throw logic_error("unhandled endpoint kind");
}

// e.g. "A -> B [label=x];" or "A --> B : x"
string format_edge(Notation const& n, DiagramEdge const& e) {
  stringstream ss;
  ss << n.indent << format_endpoint(n, e.source) << " " << n.arrow
     << " " << format_endpoint(n, e.destination);
  if (e.label)
    ss << n.label_prefix << (n.label ? n.label(*e.label) : *e.label) << n.label_suffix;
  ss << n.terminator;
  return ss.str();
}

namespace {

bool is_dot_identifier(string const& s) {
  if (s.empty() || isdigit(static_cast<unsigned char>(s.front())))
    return false;
  return all_of(cbegin(s), cend(s), [](char c){
      return isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

bool is_dot_numeral(string const& s) {
  auto it = cbegin(s);
  if (it != cend(s) && *it == '-')
    ++it;
  bool digits = false;
  bool dot = false;
  for (; it != cend(s); ++it) {
    if (isdigit(static_cast<unsigned char>(*it)))
      digits = true;
    else if (*it == '.' && !dot)
      dot = true;
    else
      return false;
  }
  return digits;
}

bool is_dot_keyword(string s) {
  transform(begin(s), end(s), begin(s), [](unsigned char c){ return tolower(c); });
  return s == "node" || s == "edge" || s == "graph"
      || s == "digraph" || s == "subgraph" || s == "strict";
}

}  // namespace

string dot_id(string const& s) {
  if ((is_dot_identifier(s) && !is_dot_keyword(s)) || is_dot_numeral(s))
    return s;

  string ret = "\"";
  for (char c : s) {
    if (c == '"')
      ret += "\\\"";
    else if (c == '\\')
      ret += "\\\\";
    else if (c == '\n')
      ret += "\\n";
    else
      ret += c;
  }
  return ret + "\"";
}

bool is_plain_name(string const& s) {
  return is_dot_identifier(s);
}

// no escapes for '"' in either language
string uml_text(string const& s) {
  string ret;
  for (char c : s) {
    if (c == '"')
      ret += '\'';
    else if (c == '\n')
      ret += "\\n";
    else
      ret += c;
  }
  return ret;
}

UmlAliases::UmlAliases(Diagram const& d) {
  set<string> seen;
  auto add = [&](string const& n){
    if (seen.emplace(n).second)
      names.push_back(n);
  };
  for (auto const& c : d.choices)
    add(c);
  for (auto const& s : d.states)
    add(s);
  for (auto const& e : d.edges) {
    if (e.source.kind == Endpoint::Kind::state)
      add(e.source.name);
    if (e.destination.kind == Endpoint::Kind::state)
      add(e.destination.name);
  }

  // aliases must not clash with the plain names
  int next = 0;
  for (auto const& n : names) {
    if (is_plain_name(n))
      continue;
    string alias;
    do {
      alias = "state_" + to_string(next++);
    } while (contains(seen, alias));
    aliases.emplace(n, alias);
  }
}

string const& UmlAliases::ref(string const& name) const {
  auto const it = aliases.find(name);
  return it != aliases.end() ? it->second : name;
}

string UmlAliases::declaration(string const& name) const {
  if (!has_alias(name))
    return name;
  return "\"" + uml_text(name) + "\" as " + aliases.at(name);
}

vector<string> UmlAliases::undeclared(vector<string> const& declared) const {
  vector<string> ret;
  for (auto const& n : names)
    if (has_alias(n) && !contains(declared, n))
      ret.push_back(n);
  return ret;
}

string render(Diagram const& d, Format f) {
  switch (f) {
    case Format::dot: return Dot(d).str();
    case Format::plantuml: return PlantUml(d).str();
    case Format::mermaid: return Mermaid(d).str();
  }
  throw logic_error("unhandled diagram format");
}

}  // namespace tsautils
