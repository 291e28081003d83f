#include "export.hh"

#include <sstream>

using namespace std;

namespace tsautils {

Notation const& plantuml_notation() {
  static Notation const n{"[*]", "[*]", "-->", " : ", "", "", "", nullptr, uml_text};
  return n;
}

void PlantUml::print(ostream& out) const {
  UmlAliases const aliases(diag);
  auto n = plantuml_notation();
  n.name = [&aliases](string const& s){ return aliases.ref(s); };

  out << "@startuml" << endl;
  out << "hide empty description" << endl;
  for (auto const& c : diag.choices)
    out << "state " << aliases.declaration(c) << " <<choice>>" << endl;
  for (auto const& s : diag.states)
    out << "state " << aliases.declaration(s) << endl;

  // targets of label overrides
  auto declared = diag.choices;
  declared.insert(declared.end(), cbegin(diag.states), cend(diag.states));
  for (auto const& s : aliases.undeclared(declared))
    out << "state " << aliases.declaration(s) << endl;

  for (auto const& e : diag.edges)
    out << format_edge(n, e) << endl;
  out << "@enduml" << endl;
}

string PlantUml::str() const {
  stringstream ss;
  print(ss);
  return ss.str();
}

}  // namespace tsautils
