#include "internal/notify/journal_notifier.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace fieldwake::notify {

JournalNotifier::JournalNotifier(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void JournalNotifier::OnArtifactStored(const CompletedArtifact& artifact) {
  db::model::ArtifactLinkRecord record;
  record.device_id        = artifact.device_id;
  record.artifact_name    = artifact.artifact_name;
  record.wake_event_id    = artifact.wake_event_id;
  record.storage_location = artifact.storage_location;
  record.site_id          = artifact.site_id;
  record.program_id       = artifact.program_id;
  record.company_id       = artifact.company_id;
  record.size_bytes       = artifact.size_bytes;
  record.linked_at_ms     = util::ToUnixMillis(artifact.completed_at);

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->InsertArtifactLink(*tx, record), "link artifact " + artifact.artifact_name);
  tx->Commit();

  FIELDWAKE_LOG_INFO("artifact stored", {observability::StringField("device_id", artifact.device_id),
                                         observability::StringField("artifact", artifact.artifact_name),
                                         observability::StringField("location", artifact.storage_location),
                                         observability::IntField("size_bytes", static_cast<int64_t>(artifact.size_bytes))});
}

void JournalNotifier::Report(const FailureReport& report) {
  db::model::FailureRecord record;
  record.id             = util::NewUUIDString();
  record.device_id      = report.device_id;
  record.artifact_name  = report.artifact_name;
  record.wake_event_id  = report.wake_event_id;
  record.code           = report.code;
  record.message        = report.message;
  record.reported_at_ms = util::ToUnixMillis(report.reported_at);

  FIELDWAKE_LOG_ERROR("transfer failure alert", {observability::StringField("device_id", report.device_id),
                                                 observability::StringField("artifact", report.artifact_name),
                                                 observability::StringField("code", model::ToString(report.code)),
                                                 observability::IntField("code_value", static_cast<int64_t>(report.code)),
                                                 observability::StringField("message", report.message)});

  auto tx = repository_->Begin();
  db::ThrowIfError(repository_->InsertFailure(*tx, record), "journal failure for " + report.artifact_name);
  tx->Commit();
}

} // namespace fieldwake::notify
