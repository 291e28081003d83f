#include "export.hh"

#include <sstream>

using namespace std;

namespace tsautils {

namespace {
// look of the two pseudo-state nodes
string const special_node = "label=\"\", fillcolor=black, fixedsize=true, height=0.25, style=filled";
}

Notation const& dot_notation() {
  static Notation const n{"_initial_", "_final_", "->", " [label=", "]", ";", "  ", dot_id, dot_id};
  return n;
}

void Dot::print(ostream& out) const {
  auto const& n = dot_notation();
  out << "digraph Automata {" << endl;
  out << n.indent << "graph [pad=\"0.25\", nodesep=\"0.75\", ranksep=\"1\"];" << endl;

  if (diag.uses_initial())
    out << n.indent << n.start_node << " [" << special_node << ", shape=circle];" << endl;

  for (auto const& c : diag.choices)
    out << n.indent << dot_id(c) << " [shape=diamond];" << endl;
  for (auto const& s : diag.states) {
    out << n.indent << dot_id(s);
    if (contains(diag.accepting, s))
      out << " [peripheries=2]";
    out << ";" << endl;
  }

  for (auto const& e : diag.edges)
    out << format_edge(n, e) << endl;

  // final is put here to be considered last by the layout
  if (diag.uses_final())
    out << n.indent << n.end_node << " [" << special_node << ", shape=doublecircle];" << endl;
  out << "}" << endl;
}

string Dot::str() const {
  stringstream ss;
  print(ss);
  return ss.str();
}

}  // namespace tsautils
