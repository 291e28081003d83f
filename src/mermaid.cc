#include "export.hh"

#include <sstream>

using namespace std;

namespace tsautils {

Notation const& mermaid_notation() {
  static Notation const n{"[*]", "[*]", "-->", " : ", "", "", "    ", nullptr, uml_text};
  return n;
}

// plain states are only declared through their edges
void Mermaid::print(ostream& out) const {
  UmlAliases const aliases(diag);
  auto n = mermaid_notation();
  n.name = [&aliases](string const& s){ return aliases.ref(s); };

  out << "stateDiagram-v2" << endl;
  for (auto const& c : diag.choices)
    out << n.indent << "state " << aliases.ref(c) << " <<choice>>" << endl;
  for (auto const& s : aliases.undeclared(diag.choices))
    out << n.indent << "state " << aliases.declaration(s) << endl;
  for (auto const& e : diag.edges)
    out << format_edge(n, e) << endl;
}

string Mermaid::str() const {
  stringstream ss;
  print(ss);
  return ss.str();
}

}  // namespace tsautils
