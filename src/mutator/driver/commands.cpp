#include "commands.hpp"

#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include "mutator/analysis/stack_tracer.hpp"
#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/common/diagnostic/diagnostic_sink.hpp"
#include "mutator/config/pass_config.hpp"
#include "mutator/il/dumper.hpp"
#include "mutator/il/instruction.hpp"
#include "mutator/il/module.hpp"
#include "mutator/il/opcode.hpp"
#include "mutator/il/procedure.hpp"
#include "mutator/il/reader.hpp"
#include "mutator/mutation/marker_catalog.hpp"
#include "mutator/mutation/mutation_pass.hpp"
#include "mutator/mutation/options.hpp"
#include "print.hpp"

namespace mutator::driver {

namespace fs = std::filesystem;

namespace {

// Explicit --config wins; otherwise mutator.toml is searched upwards from
// the working directory. No config at all yields an empty configuration.
auto LoadPassConfig(const argparse::ArgumentParser& cmd)
    -> std::optional<config::PassConfig> {
  std::optional<fs::path> path;
  if (auto explicit_path = cmd.present<std::string>("--config")) {
    path = fs::path(*explicit_path);
  } else {
    path = config::FindConfig();
  }

  if (!path) {
    spdlog::info("no {} found, using empty configuration",
                 config::kConfigFileName);
    return config::PassConfig{};
  }

  auto loaded = config::LoadConfig(*path);
  if (!loaded) {
    PrintDiagnostic(loaded.error());
    return std::nullopt;
  }
  spdlog::info("using configuration {}", path->string());
  return std::move(*loaded);
}

auto LoadListing(const argparse::ArgumentParser& cmd)
    -> std::optional<il::Module> {
  auto path = cmd.get<std::string>("listing");
  auto module = il::ReadModuleFile(path);
  if (!module) {
    PrintDiagnostic(module.error());
    return std::nullopt;
  }
  return std::move(*module);
}

// Procedures selected with --proc, or every procedure in the module.
auto SelectProcedures(const argparse::ArgumentParser& cmd, il::Module& module)
    -> std::optional<std::vector<il::Procedure*>> {
  std::vector<il::Procedure*> selected;
  auto names = cmd.present<std::vector<std::string>>("--proc");
  if (!names) {
    for (auto& proc : module.Procedures()) {
      selected.push_back(&proc);
    }
    return selected;
  }

  for (const auto& name : *names) {
    il::Procedure* proc = module.FindProcedure(name);
    if (proc == nullptr) {
      PrintError(std::format("no procedure named '{}'", name));
      return std::nullopt;
    }
    selected.push_back(proc);
  }
  return selected;
}

}  // namespace

auto RunCommand(const argparse::ArgumentParser& cmd) -> int {
  auto config = LoadPassConfig(cmd);
  if (!config) {
    return 1;
  }

  auto module = LoadListing(cmd);
  if (!module) {
    return 1;
  }

  auto procedures = SelectProcedures(cmd, *module);
  if (!procedures) {
    return 1;
  }

  analysis::StackTracer tracer;
  auto pass = mutation::MutationPass::Create(
      *module, tracer, config::BuildOptions(*config));
  if (!pass) {
    PrintDiagnostic(pass.error());
    return 1;
  }

  mutation::PassStats total;
  for (il::Procedure* proc : *procedures) {
    auto stats = pass->RunWithStats(*proc);
    if (!stats) {
      PrintDiagnostic(stats.error());
      return 1;
    }
    spdlog::info("{}: {} markers resolved", proc->Name(), stats->Total());
    total.key_fields += stats->key_fields;
    total.placeholders += stats->placeholders;
    total.crypts += stats->crypts;
  }
  spdlog::info(
      "resolved {} key fields, {} placeholders, {} crypts in {} procedures",
      total.key_fields, total.placeholders, total.crypts, procedures->size());

  if (auto output = cmd.present<std::string>("-o")) {
    std::ofstream out(*output);
    if (!out) {
      PrintError(std::format("cannot open output '{}'", *output));
      return 1;
    }
    il::Dumper dumper(&out);
    dumper.Dump(*module);
    out.flush();
    if (!out) {
      PrintError(std::format("failed to write output '{}'", *output));
      return 1;
    }
    return 0;
  }

  il::Dumper dumper(&std::cout);
  dumper.Dump(*module);
  return 0;
}

auto DumpCommand(const argparse::ArgumentParser& cmd) -> int {
  auto module = LoadListing(cmd);
  if (!module) {
    return 1;
  }
  il::Dumper dumper(&std::cout);
  dumper.Dump(*module);
  return 0;
}

// Lists marker uses per procedure without rewriting anything. Uses that the
// pass would reject are errors; uses the current configuration cannot
// resolve are warnings.
auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto config = LoadPassConfig(cmd);
  if (!config) {
    return 1;
  }

  auto module = LoadListing(cmd);
  if (!module) {
    return 1;
  }

  auto procedures = SelectProcedures(cmd, *module);
  if (!procedures) {
    return 1;
  }

  const il::TypeDef* marker_type =
      module->FindType(mutation::kMarkerTypeName);
  if (marker_type == nullptr) {
    std::cout << std::format(
        "no '{}' type in module, nothing to resolve\n",
        mutation::kMarkerTypeName);
    return 0;
  }

  mutation::MarkerCatalog catalog(marker_type);
  analysis::StackTracer tracer;
  DiagnosticSink sink;
  for (const il::Procedure* proc : *procedures) {
    const auto& body = proc->Body();
    for (size_t i = 0; i < body.size(); ++i) {
      mutation::MarkerUse use = catalog.Classify(body[i]);
      InstrLocation loc{.procedure = proc->Name(), .index = i};
      switch (use.kind) {
        case mutation::MarkerKind::kNone:
          break;

        case mutation::MarkerKind::kKeyField: {
          auto slot = mutation::ParseKeySlot(use.member);
          if (!slot) {
            sink.Error(
                ErrorCode::kUnrecognizedKeyField, loc,
                std::format("'{}' is not a recognized key field", use.member));
            break;
          }
          std::cout << std::format(
              "{}: key field {}\n", FormatLocation(loc), use.member);
          if (!config->key_values.contains(*slot)) {
            sink.Warning(
                loc, std::format("no value configured for {}", use.member));
          }
          break;
        }

        case mutation::MarkerKind::kPlaceholderCall: {
          auto trace = tracer.TraceArguments(*proc, i);
          if (!trace) {
            sink.Report(std::move(trace.error()));
            break;
          }
          if (trace->size() != 1) {
            sink.Error(
                ErrorCode::kTraceFailure, loc,
                std::format(
                    "placeholder must take exactly one argument, traced {}",
                    trace->size()));
            break;
          }
          std::cout << std::format(
              "{}: placeholder, argument at [{}, {})\n", FormatLocation(loc),
              trace->front(), i);
          if (!config->placeholder) {
            sink.Warning(loc, "no placeholder transform configured");
          }
          break;
        }

        case mutation::MarkerKind::kCryptCall: {
          bool well_formed =
              i >= 2 && body[i - 2].opcode == il::Opcode::kLoadLocal &&
              body[i - 1].opcode == il::Opcode::kLoadLocal;
          if (!well_formed) {
            sink.Error(
                ErrorCode::kMalformedCryptOperands, loc,
                "crypt marker must be preceded by 'ldloc <block>; ldloc "
                "<key>'");
            break;
          }
          std::cout << std::format(
              "{}: crypt(block={}, key={})\n", FormatLocation(loc),
              body[i - 2].AsLocal()->name, body[i - 1].AsLocal()->name);
          if (!config->crypt) {
            sink.Warning(loc, "no crypt transform configured");
          }
          break;
        }

        case mutation::MarkerKind::kUnexpected:
          sink.Error(
              ErrorCode::kUnexpectedMarkerUse, loc,
              std::format(
                  "unexpected '{}' of marker member '{}.{}'",
                  il::Mnemonic(body[i].opcode), mutation::kMarkerTypeName,
                  use.member));
          break;
      }
    }
  }

  PrintDiagnostics(sink);
  return sink.HasErrors() ? 1 : 0;
}

}  // namespace mutator::driver
