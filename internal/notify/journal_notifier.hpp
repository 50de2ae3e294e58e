#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/notify/completion_handler.hpp"
#include "internal/notify/failure_reporter.hpp"

namespace fieldwake::notify {

/*
  Default notifier: persists artifact links and failure rows through the
  repository and raises an error-level alert line per failure.
*/
class JournalNotifier final : public CompletionHandler, public FailureReporter {
 public:
  explicit JournalNotifier(std::shared_ptr<db::Repository> repository);

  void OnArtifactStored(const CompletedArtifact& artifact) override;

  void Report(const FailureReport& report) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace fieldwake::notify
