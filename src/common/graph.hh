#pragma once

#include "common/util.hh"

#include <range/v3/all.hpp>

#include <functional>
#include <optional>
#include <queue>
#include <set>
#include <map>
#include <vector>

namespace tsautils {

using namespace std;

template <typename Node>
using succ_fun = function<vector<Node>(Node const&)>;

//generic bfs. input: start node,
//function that takes current node,
//a function to schedule a visit
//a has_visited predicate
//the visit function just does whatever needed with current node and calls
//pusher function on all successors that also need to be visited.
//bfs keeps track that each node is visited once in bfs order automatically.
template <typename Node, typename F>
void bfs(Node const& start, F visit) {
  std::queue<Node> bfsq;
  std::set<Node> visited;
  std::set<Node> discovered;

  auto pusher = [&](Node const& st){
    if (discovered.emplace(st).second)
      bfsq.push(st);
  };
  auto visited_f = [&](Node const& el){ return contains(visited, el); };

  pusher(start);
  while (!bfsq.empty()) {
    auto const st = bfsq.front();
    bfsq.pop();
    if (!visited.emplace(st).second) continue;  // have visited this one

    visit(st, pusher, visited_f);
  }
}

// return set of states that are successors of given state, transitively.
// the start is only included if it lies on a cycle.
template <typename Node>
set<Node> reachable_states(Node const& from, succ_fun<Node> const& get_succ) {
  set<Node> reached;
  bfs(from, [&](Node const& st, auto const& pusher, auto const&) {
      for (auto const& sucst : get_succ(st)) {
        reached.emplace(sucst);
        pusher(sucst);
      }
  });
  return reached;
}

// directed graph with at most one labelled edge per ordered node pair.
// nodes and edges are kept in ordered maps, so iteration is deterministic.
template <typename N, typename E>
class DiGraph {
  map<N, map<N, E>> out;  // source -> target -> edge label
  map<N, set<N>> in;      // target -> sources

public:
  size_t num_nodes() const { return out.size(); }
  size_t num_edges() const {
    size_t n = 0;
    for (auto const& it : out)
      n += it.second.size();
    return n;
  }

  bool has_node(N const& n) const { return map_has_key(out, n); }
  bool has_edge(N const& a, N const& b) const {
    return has_node(a) && map_has_key(out.at(a), b);
  }

  // add node if missing, return the stored key
  N const& add_node(N const& n) {
    in[n];
    return out.emplace(n, map<N, E>{}).first->first;
  }

  // add edge a->b (adding missing nodes). returns the old label if the edge existed
  optional<E> add_edge(N const& a, N const& b, E const& e) {
    add_node(a);
    add_node(b);
    optional<E> old;
    auto& targets = out.at(a);
    auto it = targets.find(b);
    if (it != targets.end()) {
      old = it->second;
      it->second = e;
    } else {
      targets.emplace(b, e);
    }
    in.at(b).emplace(a);
    return old;
  }

  E const& edge(N const& a, N const& b) const { return out.at(a).at(b); }

  auto nodes() const { return out | ranges::views::keys; }

  vector<N> succ(N const& n) const {
    assert(has_node(n));
    return out.at(n) | ranges::views::keys | ranges::to<vector>();
  }

  vector<N> pred(N const& n) const {
    assert(has_node(n));
    auto const& srcs = in.at(n);
    return vector<N>(cbegin(srcs), cend(srcs));
  }
};

}
