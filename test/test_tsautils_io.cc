#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#include <catch2/catch.hpp>

#include "io.hh"
#include "export.hh"

using namespace tsautils;
using namespace std::string_literals;
namespace fs = std::filesystem;

using StrAut = Automaton<string, string>;
using StrIAut = IntermediateAutomaton<string, string>;

namespace {
// the tests run from the source directory
string const filedir = "test/";

Description parse(string const& text) {
  stringstream ss(text);
  return read_automaton(ss);
}

string error_of(string const& text) {
  try {
    parse(text);
  } catch (runtime_error const& e) {
    return e.what();
  }
  return "";
}
}  // namespace

TEST_CASE("Write diagram to file", "[io]") {
  auto const path = (fs::temp_directory_path() / "tsautils_write_test.dot").string();

  write_file(path, "digraph Automata {\n}\n");
  write_file(path, "line\n");  // truncates

  ifstream in(path);
  stringstream ss;
  ss << in.rdbuf();
  REQUIRE(ss.str() == "line\n");
  fs::remove(path);

  auto const bad = (fs::temp_directory_path() / "tsautils_no_such_dir" / "out.dot").string();
  REQUIRE_THROWS_AS(write_file(bad, "x"), system_error);
}

TEST_CASE("Read edge list description", "[io]") {
  auto const desc = parse(
      "automaton  # kind\n"
      "\n"
      "initial A\n"
      "final C\n"
      "edge A x B\n"
      "edge B y C\n"
      "edge B z C\n");
  REQUIRE(holds_alternative<StrAut>(desc));
  auto const& aut = get<StrAut>(desc);
  REQUIRE(aut.num_states() == 3);
  REQUIRE(aut.num_transitions() == 3);
  REQUIRE(aut.is_initial("A"s));
  REQUIRE(aut.is_final("C"s));
  REQUIRE(aut.get_graph().edge("B"s, "C"s) == Symbol<string>("z"s));
}

TEST_CASE("Read intermediate description", "[io]") {
  auto const desc = parse(
      "intermediate\n"
      "state A\n"
      "choice S\n"
      "edge * new A:Init\n"
      "edge A go S\n"
      "branch S check A end:timeout\n");
  REQUIRE(holds_alternative<StrIAut>(desc));
  auto const& aut = get<StrIAut>(desc);
  REQUIRE(aut.is_choice("S"s));
  REQUIRE(aut.num_transitions() == 3);

  auto const out = to_dot(aut);
  REQUIRE(out.find("  _initial_ -> Init [label=new];") != string::npos);
  REQUIRE(out.find("  S -> _final_ [label=timeout];") != string::npos);
  REQUIRE(out.find("  S -> A;") != string::npos);
}

TEST_CASE("Malformed descriptions", "[io]") {
  REQUIRE_THROWS_AS(parse(""), runtime_error);
  REQUIRE_THROWS_AS(parse("# only a comment\n"), runtime_error);

  REQUIRE(error_of("graph\n").find("line 1") == 0);
  REQUIRE(error_of("automaton\nedge A x\n").find("line 2") == 0);
  REQUIRE(error_of("automaton\n\nfoo A\n").find("line 3") == 0);
  REQUIRE(error_of("automaton\nchoice A\n").find("unknown directive") != string::npos);
  REQUIRE(error_of("intermediate\nedge * new end\n").find("line 2") == 0);
  REQUIRE(error_of("intermediate\nbranch * new A B\n").find("line 2") == 0);
  REQUIRE(error_of("intermediate\nedge A go :x\n").find("missing state") != string::npos);
  REQUIRE(error_of("intermediate\nedge A go B:\n").find("empty label") != string::npos);
}

TEST_CASE("Read description files", "[io]") {
  SECTION("edge list automaton") {
    auto const desc = read_automaton_file(filedir + "abc.aut");
    auto const& aut = get<StrAut>(desc);
    REQUIRE(aut.num_states() == 4);
    REQUIRE(unreachable_states(aut) == vector<State<string>>{"D"s});
    REQUIRE(unproductive_states(aut) == vector<State<string>>{"C"s, "D"s});
  }

  SECTION("intermediate automaton") {
    auto const desc = read_automaton_file(filedir + "drone.aut");
    auto const& aut = get<StrIAut>(desc);
    REQUIRE(aut.states().size() == 2);
    REQUIRE(aut.choices().size() == 1);
    REQUIRE(aut.num_transitions() == 5);

    auto const out = to_plantuml(aut);
    REQUIRE(out.find("state Check <<choice>>\n") != string::npos);
    REQUIRE(out.find("[*] --> Grounded : new\n") != string::npos);
    REQUIRE(out.find("Check --> Flying\n") != string::npos);
    REQUIRE(out.find("Check --> [*] : timeout\n") != string::npos);
    REQUIRE(out.find("Flying --> [*] : land\n") != string::npos);
  }

  SECTION("missing file") {
    REQUIRE_THROWS_AS(read_automaton_file(filedir + "no_such_file.aut"), system_error);
  }
}
