#include "io.hh"

#include <cerrno>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

using namespace std;

namespace tsautils {

void write_file(string const& path, string const& text, shared_ptr<spdlog::logger> log) {
  errno = 0;
  ofstream out(path, ios::out | ios::trunc | ios::binary);
  if (!out)
    throw system_error(errno ? errno : EIO, generic_category(), "cannot open " + path);

  out << text;
  out.flush();
  if (!out)
    throw system_error(errno ? errno : EIO, generic_category(), "cannot write " + path);

  if (log)
    log->info("wrote {} bytes to {}", text.size(), path);
}

namespace {

using StrAut = Automaton<string, string>;
using StrIAut = IntermediateAutomaton<string, string>;
using intermediate::StateNode;

[[noreturn]] void parse_error(int line, string const& msg) {
  throw runtime_error("line " + to_string(line) + ": " + msg);
}

vector<string> tokenize(string line) {
  auto const comment = line.find('#');
  if (comment != string::npos)
    line.erase(comment);
  stringstream ss(line);
  vector<string> toks;
  string tok;
  while (ss >> tok)
    toks.push_back(tok);
  return toks;
}

void expect_tokens(int line, vector<string> const& toks, size_t num) {
  if (toks.size() != num)
    parse_error(line, "'" + toks.front() + "' expects " + to_string(num-1)
        + " argument(s), got " + to_string(toks.size()-1));
}

// NAME, NAME:LABEL, end, end:LABEL
StateNode<string> parse_destination(int line, string const& tok) {
  auto const sep = tok.find(':');
  string const name = tok.substr(0, sep);
  if (name.empty())
    parse_error(line, "missing state in destination '" + tok + "'");

  StateNode<string> ret(name == "end" ? optional<string>() : optional<string>(name));
  if (sep != string::npos) {
    string const label = tok.substr(sep+1);
    if (label.empty())
      parse_error(line, "empty label in destination '" + tok + "'");
    ret.metadata.transition_label = label;
  }
  return ret;
}

void read_fa_directive(int line, vector<string> const& toks, StrAut& aut,
    shared_ptr<spdlog::logger> const& log) {
  auto const& cmd = toks.front();
  if (cmd == "state") {
    expect_tokens(line, toks, 2);
    aut.add_state(toks[1]);
  } else if (cmd == "initial") {
    expect_tokens(line, toks, 2);
    aut.add_initial_state(toks[1]);
  } else if (cmd == "final") {
    expect_tokens(line, toks, 2);
    aut.add_final_state(toks[1]);
  } else if (cmd == "edge") {
    expect_tokens(line, toks, 4);
    auto const old = aut.add_transition({toks[1], toks[3], toks[2]});
    if (old && log)
      log->debug("line {}: edge {} -> {} now drawn with {} instead of {}",
          line, toks[1], toks[3], toks[2], old->get());
  } else {
    parse_error(line, "unknown directive '" + cmd + "' in automaton description");
  }
}

void read_intermediate_directive(int line, vector<string> const& toks, StrIAut& aut,
    shared_ptr<spdlog::logger> const& log) {
  auto const& cmd = toks.front();
  if (cmd == "state") {
    expect_tokens(line, toks, 2);
    aut.add_state(toks[1]);
    return;
  }
  if (cmd == "choice") {
    expect_tokens(line, toks, 2);
    aut.add_choice(toks[1]);
    return;
  }
  if (cmd != "edge" && cmd != "branch")
    parse_error(line, "unknown directive '" + cmd + "' in intermediate description");

  if (toks.size() < 4)
    parse_error(line, "'" + cmd + "' expects a source, a symbol and a destination");

  optional<string> src;
  if (toks[1] != "*")
    src = toks[1];

  intermediate::Node<string> dst;
  if (cmd == "edge") {
    expect_tokens(line, toks, 4);
    auto const node = parse_destination(line, toks[3]);
    if (!src && node.is_final())
      parse_error(line, "edge from '*' can not lead to 'end'");
    dst = node;
  } else {
    if (!src)
      parse_error(line, "branch from '*' is not allowed");
    intermediate::Decision<string> branches;
    for (size_t i = 3; i < toks.size(); ++i)
      branches.push_back(parse_destination(line, toks[i]));
    dst = branches;
  }

  if (aut.add_transition(src, toks[2], dst) && log)
    log->warn("line {}: transition {} from {} redefined, previous destination dropped",
        line, toks[2], src ? *src : "*");
}

}  // namespace

Description read_automaton(istream& in, shared_ptr<spdlog::logger> log) {
  optional<Description> ret;
  string buf;
  int line = 0;
  while (getline(in, buf)) {
    ++line;
    auto const toks = tokenize(buf);
    if (toks.empty())
      continue;

    if (!ret) {
      if (toks.size() == 1 && toks.front() == "automaton")
        ret = StrAut();
      else if (toks.size() == 1 && toks.front() == "intermediate")
        ret = StrIAut();
      else
        parse_error(line, "expected 'automaton' or 'intermediate', got '" + toks.front() + "'");
      continue;
    }

    if (auto* aut = get_if<StrAut>(&*ret))
      read_fa_directive(line, toks, *aut, log);
    else
      read_intermediate_directive(line, toks, get<StrIAut>(*ret), log);
  }

  if (!ret)
    throw runtime_error("empty description: missing 'automaton' or 'intermediate' header");

  if (log) {
    visit(overloaded {
      [&](StrAut const& aut) {
        log->info("read automaton with {} states and {} transitions",
            aut.num_states(), aut.num_transitions());
      },
      [&](StrIAut const& aut) {
        log->info("read intermediate automaton with {} states, {} choices and {} transitions",
            aut.states().size(), aut.choices().size(), aut.num_transitions());
      }
    }, *ret);
  }
  return *ret;
}

Description read_automaton_file(string const& filename, shared_ptr<spdlog::logger> log) {
  if (filename.empty())
    return read_automaton(cin, log);

  errno = 0;
  ifstream in(filename);
  if (!in)
    throw system_error(errno ? errno : ENOENT, generic_category(), "cannot open " + filename);
  return read_automaton(in, log);
}

}  // namespace tsautils
