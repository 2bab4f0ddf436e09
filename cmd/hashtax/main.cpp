#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/export_pipeline.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/exit_codes.hpp"

using hashtax::observability::IntField;
using hashtax::observability::StringField;
using hashtax::pipeline::ExportPipeline;
using hashtax::pipeline::ExportRequest;
using hashtax::runtime::config::RuntimeConfig;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  hashtax [--config <config.yaml>] export <table>... [-o <out.parquet>] [-t <taxonomy.csv>]\n"
            << "                                   [--lca-info <summary.csv>] [--names-only]\n"
            << "  hashtax [--config <config.yaml>] merge <table> -o <out.parquet>\n"
            << "  hashtax [--config <config.yaml>] summarize <table>... -o <summary.csv>\n"
            << "  hashtax [--config <config.yaml>] ksize-ranks <table>... -o <out.csv>\n";
}

struct CommandLine {
  std::string config_path;
  std::string command;

  std::vector<std::string> inputs;
  std::string              output;
  std::string              taxonomy;
  std::string              lca_info;
  bool                     names_only = false;
};

static std::optional<CommandLine> ParseArgs(int argc, char** argv) {
  CommandLine cli;
  int         i = 1;

  if (i + 1 < argc && std::string(argv[i]) == "--config") {
    cli.config_path = argv[i + 1];
    i += 2;
  }
  if (i >= argc) return std::nullopt;
  cli.command = argv[i++];

  auto value_of = [&](const std::string& flag) -> std::optional<std::string> {
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << flag << "\n";
      return std::nullopt;
    }
    return std::string(argv[++i]);
  };

  for (; i < argc; ++i) {
    const std::string arg = argv[i];

    std::optional<std::string> value;
    if (arg == "-o" || arg == "--output") {
      if (!(value = value_of(arg))) return std::nullopt;
      cli.output = *value;
    } else if (arg == "-t" || arg == "--taxonomy" || arg == "--lineages") {
      if (!(value = value_of(arg))) return std::nullopt;
      cli.taxonomy = *value;
    } else if (arg == "--lca-info") {
      if (!(value = value_of(arg))) return std::nullopt;
      cli.lca_info = *value;
    } else if (arg == "--names-only") {
      cli.names_only = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "unknown option: " << arg << "\n";
      return std::nullopt;
    } else {
      cli.inputs.push_back(arg);
    }
  }

  return cli;
}

static int Run(const CommandLine& cli, const RuntimeConfig& config) {
  ExportPipeline pipeline(config);

  if (cli.command == "export") {
    ExportRequest request;
    request.inputs        = cli.inputs;
    request.output        = cli.output;
    request.taxonomy_path = cli.taxonomy;
    request.lca_info_path = cli.lca_info;
    request.names_only    = cli.names_only;

    if (request.output.empty()) {
      request.output = hashtax::pipeline::DefaultOutputPath(cli.inputs.front());
      HASHTAX_LOG_INFO("No output file specified, using default", {StringField("path", request.output)});
    }

    auto result = pipeline.Run(request);
    HASHTAX_LOG_INFO("...export is done!", {IntField("input_rows", static_cast<std::int64_t>(result.input_rows)),
                                            IntField("output_rows", static_cast<std::int64_t>(result.output_rows))});
    return hashtax::util::kExitOk;
  }

  if (cli.output.empty()) {
    throw hashtax::util::InvalidArgument(cli.command + " requires -o <output>");
  }

  if (cli.command == "merge") {
    if (cli.inputs.size() != 1) {
      throw hashtax::util::InvalidArgument("merge takes exactly one input table");
    }
    pipeline.Merge(cli.inputs.front(), cli.output);
    return hashtax::util::kExitOk;
  }

  if (cli.command == "summarize") {
    pipeline.Summarize(cli.inputs, cli.output);
    return hashtax::util::kExitOk;
  }

  if (cli.command == "ksize-ranks") {
    pipeline.KsizeRanks(cli.inputs, cli.output);
    return hashtax::util::kExitOk;
  }

  throw hashtax::util::InvalidArgument("unknown command: " + cli.command);
}

int main(int argc, char** argv) {
  auto cli = ParseArgs(argc, argv);
  if (!cli || cli->inputs.empty()) {
    Usage();
    return hashtax::util::kExitUsage;
  }

  RuntimeConfig config;
  hashtax::observability::InitializeLogging(config);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    if (!cli->config_path.empty()) {
      config = hashtax::config::ConfigLoader::LoadFromYaml(cli->config_path);
      hashtax::observability::InitializeLogging(config);
    }

    const int code = Run(*cli, config);
    hashtax::observability::ShutdownLogging();
    return code;
  } catch (const std::exception& e) {
    HASHTAX_LOG_ERROR(std::string("Error: ") + e.what());
    hashtax::observability::ShutdownLogging();
    return hashtax::util::ToExitCode(e);
  }
}
