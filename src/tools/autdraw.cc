#include <iostream>
#include <string>
#include <system_error>
using namespace std;

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>
namespace spd = spdlog;
#include <args.hxx>

#include "common/util.hh"
#include "aut.hh"
#include "intermediate.hh"
#include "diagram.hh"
#include "export.hh"
#include "io.hh"

using namespace tsautils;

struct Args {
  string file;
  string outfile;

  int verbose;
  bool report;

  Format format;
};

Args parse_args(int argc, char *argv[]) {
  args::ArgumentParser parser("autdraw - render automata as Graphviz, PlantUML or Mermaid diagrams", "");
  args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

  args::Positional<string> input(parser, "INPUTFILE",
      "file containing the automaton description (if none given, uses <stdin>)");

  // logging level -v, -vv, etc.
  args::CounterFlag verbose(parser, "verbose", "Show verbose information",
      {'v', "verbose"});
  args::Flag report(parser, "report", "Log reachability and productivity of the automaton",
      {'r', "report"});

  args::ValueFlag<string> format(parser, "FORMAT", "Diagram format (dot, plantuml, mermaid)",
      {'f', "format"});
  args::ValueFlag<string> outfile(parser, "OUTFILE", "Write diagram to file (default: <stdout>)",
      {'o', "output"});

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help&) {
    std::cout << parser;
    exit(0);
  } catch (args::ParseError& e) {
    cerr << e.what() << endl << parser;
    exit(1);
  } catch (args::ValidationError& e) {
    cerr << e.what() << endl << parser;
    exit(1);
  }

  Args args;
  args.format = Format::dot;
  if (format) {
    auto const f = parse_format(args::get(format));
    if (!f) {
      spd::get("log")->error("Invalid diagram format provided: {}", args::get(format));
      exit(1);
    }
    args.format = *f;
  }

  if (input)
    args.file = args::get(input);
  if (outfile)
    args.outfile = args::get(outfile);
  args.verbose = args::get(verbose);
  args.report = report;

  return args;
}

void report_automaton(Automaton<string, string> const& aut, shared_ptr<spdlog::logger> log) {
  log->info("automaton: {} states, {} initial, {} final, {} transitions",
            aut.num_states(), aut.initial_states().size(),
            aut.final_states().size(), aut.num_transitions());

  for (auto const& s : aut.states()) {
    log->info("state {}: reaches {{{}}}, {}", s.get(), seq_to_str(aut.reachable(s)),
              aut.is_productive(s) ? "productive" : "unproductive");
  }

  if (aut.initial_states().empty())
    log->warn("automaton has no initial state");
  auto const unreach = unreachable_states(aut);
  if (!unreach.empty())
    log->warn("unreachable states: {}", seq_to_str(unreach));
  auto const unprod = unproductive_states(aut);
  if (!unprod.empty())
    log->warn("unproductive states: {}", seq_to_str(unprod));

  if (!aut.is_deterministic())
    log->info("automaton is nondeterministic");
}

void report_automaton(IntermediateAutomaton<string, string> const& aut, shared_ptr<spdlog::logger> log) {
  log->info("intermediate automaton: {} states, {} choices, {} transitions",
            aut.states().size(), aut.choices().size(), aut.num_transitions());
  if (!map_has_key(aut.delta(), optional<string>()))
    log->warn("intermediate automaton has no transition from the initial pseudo-state");
}

int main(int argc, char *argv[]) {
  // initialize stuff (args + logging):
  auto const log = spd::stderr_logger_mt("log");
  spd::set_pattern("[%Y-%m-%d %H:%M:%S %z] [%l] %v");

  auto const args = parse_args(argc, argv);
  if (!args.verbose)
    spd::set_level(spd::level::warn);
  else if (args.verbose == 1)
    spd::set_level(spd::level::info);
  else
    spd::set_level(spd::level::debug);

  // now parse input automaton
  Description desc;
  try {
    desc = read_automaton_file(args.file, log);
  } catch (system_error const& e) {
    log->error("Reading automaton from {} failed: {}", args.file.empty() ? "stdin" : args.file, e.what());
    exit(1);
  } catch (runtime_error const& e) {
    log->error("Parsing automaton from {} failed: {}", args.file.empty() ? "stdin" : args.file, e.what());
    exit(1);
  }

  if (args.report)
    visit([&log](auto const& aut){ report_automaton(aut, log); }, desc);

  // a broken intermediate automaton throws logic_error here, which is not caught
  auto const diagram = visit([](auto const& aut){ return make_diagram(aut); }, desc);
  auto const text = render(diagram, args.format);
  log->debug("rendered {} diagram with {} edges", format_name(args.format), diagram.edges.size());

  if (args.outfile.empty()) {
    cout << text;
    return 0;
  }

  try {
    write_file(args.outfile, text, log);
  } catch (system_error const& e) {
    log->error("Writing diagram failed: {}", e.what());
    exit(1);
  }
}
