#include <set>
#include <vector>

#include <catch2/catch.hpp>

#include "aut.hh"
#include "fa.hh"

using namespace tsautils;

using CharAut = Automaton<char, char>;
using St = State<char>;

TEST_CASE("State and symbol wrappers", "[types]") {
  REQUIRE(State<int>(1) == State<int>(1));
  REQUIRE(State<int>(1) != State<int>(2));
  REQUIRE(State<int>(1) < State<int>(2));
  REQUIRE(Symbol<int>(3).get() == 3);
  REQUIRE(hash<State<int>>()(State<int>(7)) == hash<int>()(7));
  REQUIRE(to_str(Symbol<char>('x')) == "x");

  Transition<char, char> const t('A', 'B', 'x');
  REQUIRE(t == Transition<char, char>('A', 'B', 'x'));
  REQUIRE(!(t == Transition<char, char>('A', 'B', 'y')));
  REQUIRE(t < Transition<char, char>('A', 'C', 'a'));
}

TEST_CASE("Automaton construction", "[aut]") {
  CharAut aut;

  SECTION("adding states is idempotent") {
    auto const& a = aut.add_state('A');
    REQUIRE(a == St('A'));
    aut.add_state('A');
    aut.add_initial_state('A');
    aut.add_final_state('A');
    REQUIRE(aut.num_states() == 1);
    REQUIRE(aut.is_initial('A'));
    REQUIRE(aut.is_final('A'));
  }

  SECTION("initial and final states are states") {
    aut.add_initial_state('A');
    aut.add_final_state('C');
    REQUIRE(aut.states() == set<St>{'A','C'});
    REQUIRE(aut.initial_states() == set<St>{'A'});
    REQUIRE(aut.final_states() == set<St>{'C'});
    REQUIRE(!aut.is_final('A'));
    REQUIRE(!aut.has_state('B'));
  }

  SECTION("transition endpoints become states") {
    REQUIRE(!aut.add_transition({'A', 'B', 'x'}));
    REQUIRE(aut.states() == set<St>{'A','B'});
    REQUIRE(aut.succ('A') == vector<St>{'B'});
    REQUIRE(aut.pred('B') == vector<St>{'A'});
  }

  SECTION("second symbol between same pair replaces the graph label only") {
    aut.add_transition({'A', 'B', 'x'});
    auto const old = aut.add_transition({'A', 'B', 'y'});
    REQUIRE(old);
    REQUIRE(old->get() == 'x');
    REQUIRE(aut.get_graph().edge('A', 'B') == Symbol<char>('y'));
    REQUIRE(aut.num_transitions() == 2);
    REQUIRE(aut.get_graph().num_edges() == 1);
  }

  SECTION("determinism") {
    aut.add_transition({'A', 'B', 'x'});
    aut.add_transition({'A', 'C', 'y'});
    REQUIRE(aut.is_deterministic());
    aut.add_transition({'A', 'D', 'x'});
    REQUIRE(!aut.is_deterministic());
  }
}

TEST_CASE("Reachability and productivity", "[reach]") {
  CharAut aut;
  aut.add_initial_state('A');
  aut.add_state('B');
  aut.add_final_state('C');
  aut.add_transition({'A', 'B', 'x'});
  aut.add_transition({'B', 'C', 'y'});

  SECTION("simple chain") {
    REQUIRE(aut.reachable('A') == set<St>{'B','C'});
    REQUIRE(aut.reachable('B') == set<St>{'C'});
    REQUIRE(aut.reachable('C').empty());

    REQUIRE(aut.is_productive('A'));
    REQUIRE(aut.is_productive('B'));
    // final, but nothing reachable from it
    REQUIRE(!aut.is_productive('C'));
  }

  SECTION("start state is reported only on a cycle") {
    aut.add_transition({'C', 'A', 'z'});
    REQUIRE(aut.reachable('A') == set<St>{'A','B','C'});
    REQUIRE(aut.is_productive('C'));
  }

  SECTION("self loop on final state makes it productive") {
    aut.add_transition({'C', 'C', 'z'});
    REQUIRE(aut.reachable('C') == set<St>{'C'});
    REQUIRE(aut.is_productive('C'));
  }

  SECTION("unreachable and unproductive states") {
    aut.add_state('D');
    aut.add_transition({'D', 'A', 'w'});
    aut.add_state('E');
    REQUIRE(unreachable_states(aut) == vector<St>{'D','E'});
    REQUIRE(unproductive_states(aut) == vector<St>{'C','E'});
  }
}

TEST_CASE("Reachability in a branching graph", "[reach]") {
  Automaton<int, int> aut;
  for (int i : {1,2,3,4})
    aut.add_initial_state(i);

  aut.add_transition({1, 2, 1});
  aut.add_transition({1, 3, 2});
  aut.add_transition({3, 2, 3});
  aut.add_transition({2, 3, 4});
  aut.add_transition({2, 4, 4});

  REQUIRE(aut.reachable(1) == set<State<int>>{2,3,4});
  REQUIRE(aut.reachable(2) == set<State<int>>{2,3,4});
  REQUIRE(aut.reachable(4).empty());
  REQUIRE(!aut.is_productive(1)); // no final states at all
}

TEST_CASE("Conversion to labelled NFA", "[fa]") {
  CharAut aut;
  aut.add_initial_state('A');
  aut.add_final_state('C');
  aut.add_transition({'A', 'B', 'x'});
  aut.add_transition({'A', 'C', 'x'});

  auto const nfa = to_nfa(aut);
  REQUIRE(nfa.states.size() == 3);
  REQUIRE(nfa.initial_states.at('A').empty());
  REQUIRE(nfa.final_states.at('C').empty());
  REQUIRE(nfa.delta.at('A').at('x') == set<St>{'B','C'});
  REQUIRE(!map_has_key(nfa.delta, St('B')));
}

TEST_CASE("Labelled DFA and NFA construction", "[fa]") {
  Dfa<char, char> dfa;
  dfa.add_initial_state('A', 'n');
  dfa.add_initial_state('A', 'm');
  dfa.add_final_state('B');
  dfa.add_transition('A', 'x', 'B');
  dfa.add_transition('A', 'x', 'C');

  REQUIRE(dfa.states == set<char>{'A','B','C'});
  REQUIRE(dfa.initial_states.at('A') == set<char>{'m','n'});
  REQUIRE(dfa.final_states.at('B').empty());
  REQUIRE(dfa.delta.at('A').at('x') == 'C'); // last one wins

  Nfa<char, char> nfa;
  nfa.add_transition('A', 'x', 'B');
  nfa.add_transition('A', 'x', 'C');
  REQUIRE(nfa.delta.at('A').at('x') == set<char>{'B','C'});
}
