#include "gimba/core/reconciliation.hpp"

#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "gimba/core/text_format.hpp"

namespace gimba::core {

namespace {

std::string quote_name(std::string_view text) {
  return "\"" + std::string(text) + "\"";
}

void log_exception(const std::exception& error, PassLog& log) {
  for (const std::string& line : DescribeException(error)) {
    log.Line("    " + line);
  }
}

std::vector<std::string> precheck_summary(const OutcomeCounters& counters, bool ready) {
  std::vector<std::string> lines;
  lines.emplace_back("Summary of pre-check results:");
  lines.push_back(MakeCountOkMessage(counters.geometries, counters.geometries > 0,
                                     "* Found {0} thread geometr{1}", "ies", "y"));
  lines.push_back(MakeCountOkMessage(counters.existing_artifacts, true, "* Found {0} existing thread material{1}"));
  lines.push_back(MakeCountOkMessage(counters.valid_templates, counters.valid_templates > 0,
                                     "* Found {0} valid template material{1}"));
  lines.push_back(MakeCountMessage(counters.invalid_templates, "* Found {0} invalid template material{1} --> ") +
                  (counters.invalid_templates > 0 ? "ignore" : "ok"));
  if (!ready) {
    lines.emplace_back("");
    lines.emplace_back("Issues marked with \"NOT OK\" obstruct operation.");
  }
  return lines;
}

OutcomeCounters discovery_counters(const OutcomeCounters& discovered) {
  OutcomeCounters counters{};
  counters.geometries = discovered.geometries;
  counters.valid_templates = discovered.valid_templates;
  counters.invalid_templates = discovered.invalid_templates;
  counters.existing_artifacts = discovered.existing_artifacts;
  return counters;
}

void fill_wrapup(PassReport& report) {
  const OutcomeCounters& c = report.counters;
  const bool errors = c.has_failures();
  report.warning = errors;
  report.title = errors ? "Operation Completed with Errors" : "Operation Completed";
  report.content = "See details and log file for further information.";
  report.details.clear();
  report.details.emplace_back("Summary of operations performed:");

  if (report.mode == PassMode::kCreate) {
    if (!errors && c.created == 0 && c.overwritten == 0) {
      report.outcome = PassOutcome::kNothingToDo;
      report.instruction = "All thread materials were already present. Did not create new materials.";
    } else {
      report.outcome = PassOutcome::kCompleted;
      report.instruction = MakeCountMessage(c.created + c.overwritten, "Created {0} thread material{1}.");
    }
    report.details.push_back(MakeCountMessage(c.created, "* Created {0} new material{1}"));
    report.details.push_back(MakeCountMessage(c.overwritten, "* Overwrote {0} material{1}"));
    if (c.skipped > 0) {
      report.details.push_back(MakeCountMessage(c.skipped, "* Skipped {0} existing material{1}"));
    }
    if (c.create_failed > 0) {
      report.details.push_back(MakeCountMessage(c.create_failed, "* Failed to create {0} material{1}"));
    }
    if (c.overwrite_failed > 0) {
      report.details.push_back(MakeCountMessage(c.overwrite_failed, "* Failed to overwrite {0} material{1}"));
    }
    return;
  }

  if (!errors && c.deleted == 0) {
    report.outcome = PassOutcome::kNothingToDo;
    report.instruction = "No thread materials were found. Did not delete any materials.";
  } else {
    report.outcome = PassOutcome::kCompleted;
    report.instruction = MakeCountMessage(c.deleted, "Deleted {0} thread material{1}.");
  }
  report.details.push_back(MakeCountMessage(c.deleted, "* Deleted {0} material{1}"));
  if (c.delete_failed > 0) {
    report.details.push_back(MakeCountMessage(c.delete_failed, "* Failed to delete {0} material{1}"));
  }
}

}  // namespace

std::string_view to_string(PassMode mode) {
  switch (mode) {
    case PassMode::kCreate:
      return "create";
    case PassMode::kDelete:
      return "delete";
  }
  return "unknown";
}

std::string_view to_string(PassOutcome outcome) {
  switch (outcome) {
    case PassOutcome::kCompleted:
      return "completed";
    case PassOutcome::kNothingToDo:
      return "nothing_to_do";
    case PassOutcome::kPreconditionFailed:
      return "precondition_failed";
    case PassOutcome::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

ReconciliationEngine::ReconciliationEngine(ArtifactStore& store, TransactionScope& transactions,
                                           const GeometryTable& geometries, const NameCodec& codec)
    : store_(store), transactions_(transactions), geometries_(geometries), codec_(codec), validator_(codec) {}

DiscoveryResult ReconciliationEngine::Discover(PassLog& log) const {
  DiscoveryResult discovery;
  log.Line();
  log.Line("Pre-Checks");

  log.Line("- Searching thread geometries");
  discovery.geometries = geometries_.thread_geometries();
  for (const ThreadGeometry& thread : discovery.geometries) {
    log.Line("   - " + thread.describe());
  }
  discovery.counters.geometries = discovery.geometries.size();

  log.Line("- Searching existing thread materials");
  discovery.existing = store_.Find(codec_.derived_pattern());
  for (const ArtifactRef& ref : discovery.existing) {
    log.Line("   - Material " + quote_name(ref.name));
  }
  discovery.counters.existing_artifacts = discovery.existing.size();

  log.Line("- Searching and checking thread template materials");
  for (const ArtifactRef& ref : store_.Find(codec_.template_pattern())) {
    TemplateCandidate candidate{};
    candidate.ref = ref;
    try {
      candidate.check = validator_.Validate(store_.Load(ref));
    } catch (const std::exception& e) {
      candidate.check.code = TemplateCheckCode::kUnreadable;
      candidate.check.reason = "Material " + quote_name(ref.name) + " cannot be read: " + e.what();
      candidate.check.trace.push_back("  - Material " + quote_name(ref.name) + " cannot be read -> FAILED");
      log.Lines(candidate.check.trace);
      log.Line("Check failed on template material " + quote_name(ref.name));
      log_exception(e, log);
      discovery.invalid_templates.push_back(std::move(candidate));
      continue;
    }
    log.Lines(candidate.check.trace);
    if (candidate.check.ok()) {
      discovery.valid_templates.push_back(std::move(candidate));
      continue;
    }
    log.Line("Check failed on template material " + quote_name(ref.name));
    log.Line("    " + candidate.check.reason);
    discovery.invalid_templates.push_back(std::move(candidate));
  }
  discovery.counters.valid_templates = discovery.valid_templates.size();
  discovery.counters.invalid_templates = discovery.invalid_templates.size();

  const OutcomeCounters& c = discovery.counters;
  log.Line(discovery.ready() ? "- PRE-CHECK OK" : "- PRE-CHECK FAILED");
  log.Line(MakeCountOkMessage(c.geometries, c.geometries > 0, "  - Found {0} thread geometr{1}", "ies", "y"));
  log.Line(MakeCountOkMessage(c.existing_artifacts, true, "  - Found {0} existing thread material{1}"));
  log.Line(MakeCountOkMessage(c.valid_templates, c.valid_templates > 0, "  - Found {0} valid template material{1}"));
  return discovery;
}

PassReport ReconciliationEngine::Execute(const DiscoveryResult& discovery, const ReconcileRequest& request,
                                         PassLog& log) {
  if (!discovery.ready()) {
    log.Line();
    log.Line("Pre-checks failed. No operation performed.");
    return MakePreconditionReport(discovery);
  }

  PassReport report;
  report.mode = request.mode;
  report.counters = discovery_counters(discovery.counters);

  const std::string transaction_name =
      request.mode == PassMode::kCreate ? "Create Thread Materials" : "Delete Thread Materials";
  log.Line();
  log.Line("Starting transaction " + quote_name(transaction_name));
  transactions_.Run(transaction_name, [&]() {
    if (request.mode == PassMode::kCreate) {
      ExecuteCreate(discovery, request.overwrite_existing, report.counters, log);
    } else {
      ExecuteDelete(discovery, report.counters, log);
    }
    log.Line();
    log.Line("Committing transaction " + quote_name(transaction_name));
  });

  fill_wrapup(report);
  log.Line();
  log.Line("Wrap-up");
  log.Line("- " + report.title + ": " + report.instruction);
  return report;
}

PassReport ReconciliationEngine::Run(InteractionPrompt& prompt, PassLog& log) {
  const DiscoveryResult discovery = Discover(log);
  if (!discovery.ready()) {
    return Execute(discovery, ReconcileRequest{}, log);
  }

  log.Line();
  log.Line("Welcome dialog...");
  const PromptChoice choice = prompt.Choose(BuildPromptContext(discovery, store_.document_name()));
  ReconcileRequest request{};
  request.overwrite_existing = choice.overwrite_existing;
  switch (choice.action) {
    case PromptAction::kCreate:
      log.Line("- Create thread materials operation selected by user");
      request.mode = PassMode::kCreate;
      break;
    case PromptAction::kDelete:
      log.Line("- Delete thread materials operation selected by user");
      request.mode = PassMode::kDelete;
      break;
    case PromptAction::kCancel: {
      log.Line("- Cancelled by user");
      PassReport report;
      report.outcome = PassOutcome::kCancelled;
      report.counters = discovery_counters(discovery.counters);
      report.title = "Cancelled";
      report.instruction = "No operation was performed.";
      return report;
    }
  }
  return Execute(discovery, request, log);
}

PromptContext ReconciliationEngine::BuildPromptContext(const DiscoveryResult& discovery,
                                                       std::string_view document_name) {
  const OutcomeCounters& c = discovery.counters;
  PromptContext context;
  context.ready = discovery.ready();
  context.details = precheck_summary(c, context.ready);
  context.instruction = "This pass performs batch operations on ISO metric screw thread materials. ";
  context.content = "Working document is: " + std::string(document_name) + "\n";
  if (!context.ready) {
    context.title = "Pre-Checks Failed";
    context.instruction += "Pre-checks failed, however. No operation is possible on document.";
    context.content += "See details and log file for further information.";
    return context;
  }

  context.title = "Good to Go...";
  context.instruction += "Please select an option!";
  context.content += "See details for results of pre-checks.";
  context.create_label = "Create thread materials";
  context.create_hint = MakeCountMessage(c.desired_artifacts(),
                                         "Will create {0} thread material{1}. Depending on the number of materials "
                                         "being created, the operation may take a few seconds.");
  if (c.existing_artifacts > 0) {
    context.create_hint +=
        " " + MakeCountMessage(c.existing_artifacts,
                               "Please choose below whether {0} existing thread material{1} shall be overwritten.");
    context.delete_available = true;
    context.delete_label = "Delete thread materials";
    context.delete_hint = MakeCountMessage(
        c.existing_artifacts,
        "Will delete {0} existing thread material{1}. Template or other materials will not be deleted!");
    context.overwrite_available = true;
    context.overwrite_label = MakeCountMessage(c.existing_artifacts, "Overwrite existing thread material{1}");
  }
  return context;
}

PassReport ReconciliationEngine::MakePreconditionReport(const DiscoveryResult& discovery) {
  PassReport report;
  report.outcome = PassOutcome::kPreconditionFailed;
  report.counters = discovery_counters(discovery.counters);
  report.title = "Pre-Checks Failed";
  report.instruction = "Pre-checks failed. No operation is possible on document.";
  report.content = "See details and log file for further information.";
  report.details = precheck_summary(discovery.counters, false);
  report.warning = true;
  return report;
}

void ReconciliationEngine::ExecuteCreate(const DiscoveryResult& discovery, bool overwrite,
                                         OutcomeCounters& counters, PassLog& log) {
  log.Line();
  log.Line("Creating thread materials");
  for (const TemplateCandidate& source : discovery.valid_templates) {
    for (const ThreadGeometry& thread : discovery.geometries) {
      const std::string name = codec_.EncodeDerived(source.check.category, thread.nominal_diameter);

      std::optional<ArtifactRef> existing;
      try {
        existing = store_.FindNamed(name);
      } catch (const std::exception& e) {
        log.Line("  Failed to look up " + quote_name(name));
        log_exception(e, log);
        ++(overwrite ? counters.overwrite_failed : counters.create_failed);
        continue;
      }

      if (existing.has_value() && !overwrite) {
        log.Line("- Skip existing material " + quote_name(existing->name));
        ++counters.skipped;
        continue;
      }

      if (existing.has_value()) {
        log.Line("- Overwriting thread material " + quote_name(name));
        if (!TryDelete(*existing, "  Failed to remove " + quote_name(name), log)) {
          ++counters.overwrite_failed;
          continue;
        }
        if (TryCreate(source, thread, name, log)) {
          ++counters.overwritten;
        } else {
          ++counters.overwrite_failed;
        }
        continue;
      }

      if (TryCreate(source, thread, name, log)) {
        ++counters.created;
      } else {
        ++counters.create_failed;
      }
    }
  }
}

void ReconciliationEngine::ExecuteDelete(const DiscoveryResult& discovery, OutcomeCounters& counters,
                                         PassLog& log) {
  log.Line();
  log.Line("Deleting thread materials");
  for (const ArtifactRef& ref : discovery.existing) {
    log.Line("- Deleting thread material " + quote_name(ref.name));
    if (TryDelete(ref, "  Failed to delete thread material " + quote_name(ref.name), log)) {
      ++counters.deleted;
    } else {
      ++counters.delete_failed;
    }
  }
}

bool ReconciliationEngine::TryCreate(const TemplateCandidate& source, const ThreadGeometry& thread,
                                     const std::string& name, PassLog& log) {
  log.Line("- Creating M" + std::to_string(thread.nominal_diameter) + " thread material from template " +
           quote_name(source.ref.name));
  const DerivedArtifactEdits edits = make_derived_artifact_edits(source.check.category, thread);
  try {
    const EditResult<ArtifactRef> result = store_.Create(source.ref, name, edits);
    if (result.ok) {
      return true;
    }
    log.Line("  Failed to create " + quote_name(name));
    log.Line("    " + result.error);
  } catch (const std::exception& e) {
    log.Line("  Failed to create " + quote_name(name));
    log_exception(e, log);
  }
  return false;
}

bool ReconciliationEngine::TryDelete(const ArtifactRef& ref, std::string_view failure_line, PassLog& log) {
  try {
    const EditResult<bool> result = store_.Delete(ref);
    if (result.ok) {
      return true;
    }
    log.Line(failure_line);
    log.Line("    " + result.error);
  } catch (const std::exception& e) {
    log.Line(failure_line);
    log_exception(e, log);
  }
  return false;
}

}  // namespace gimba::core
