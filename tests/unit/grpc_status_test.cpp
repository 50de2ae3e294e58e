#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "fakes/engine_fakes.hpp"
#include "fieldwake/v1.hpp"
#include "internal/command/command_queue.hpp"
#include "internal/core/wake_router.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/sweep/chunk_sweeper.hpp"
#include "internal/util/errors.hpp"

namespace {

using fieldwake::testing::TestEngine;

fieldwake::service::ServiceContext BuildServiceContext(TestEngine& engine) {
  fieldwake::service::ServiceContext ctx;
  ctx.router     = std::make_shared<fieldwake::core::WakeRouter>(engine.context);
  ctx.sweeper    = std::make_shared<fieldwake::sweep::ChunkSweeper>(engine.context);
  ctx.commands   = std::make_shared<fieldwake::command::CommandQueue>(16);
  ctx.chunks     = engine.chunks;
  ctx.repository = engine.repository;
  ctx.now        = engine.clock.Fn();
  return ctx;
}

void TestErrorMapping() {
  using namespace fieldwake::util;
  using fieldwake::grpc::ToStatus;

  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(IllegalTransition("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(MalformedMessage("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(DeadlineExceeded("x")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(Unavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestMissingWakeEventReturnsNotFound() {
  TestEngine                   engine;
  auto                         admin = std::make_shared<fieldwake::service::AdminService>(BuildServiceContext(engine));
  fieldwake::grpc::AdminServer server(admin);

  fieldwake::v1::GetWakeEventRequest req;
  req.set_id("missing-wake");
  fieldwake::v1::WakeEvent resp;
  ::grpc::ServerContext    grpc_ctx;

  const auto status = server.GetWakeEvent(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestMissingTransferAndDeviceReturnNotFound() {
  TestEngine                   engine;
  auto                         admin = std::make_shared<fieldwake::service::AdminService>(BuildServiceContext(engine));
  fieldwake::grpc::AdminServer server(admin);

  fieldwake::v1::GetTransferRequest transfer_req;
  transfer_req.set_device_id("AABBCCDDEEFF");
  transfer_req.set_artifact_name("none.jpg");
  fieldwake::v1::ImageTransfer transfer_resp;
  ::grpc::ServerContext        ctx1;
  assert(server.GetTransfer(&ctx1, &transfer_req, &transfer_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  fieldwake::v1::GetDeviceRequest device_req;
  device_req.set_device_id("aa:bb:cc:dd:ee:ff");
  fieldwake::v1::DeviceState device_resp;
  ::grpc::ServerContext      ctx2;
  assert(server.GetDevice(&ctx2, &device_req, &device_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestMalformedDeliveryIsDiscardedNotAnError() {
  TestEngine                    engine;
  auto                          ingest = std::make_shared<fieldwake::service::IngestService>(BuildServiceContext(engine));
  fieldwake::grpc::IngestServer server(ingest, std::chrono::milliseconds(10));

  fieldwake::v1::DeliverRequest req;
  req.set_topic("ESP32CAM/AABBCCDDEEFF/data");
  req.set_payload("{not json");
  fieldwake::v1::DeliverResponse resp;
  ::grpc::ServerContext          grpc_ctx;

  const auto status = server.Deliver(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.disposition() == fieldwake::v1::DELIVERY_DISPOSITION_DISCARDED);
  assert(!resp.detail().empty());
}

void TestDeliveryRoutesAndAdminReadsBack() {
  TestEngine engine;
  auto       ctx    = BuildServiceContext(engine);
  auto       ingest = std::make_shared<fieldwake::service::IngestService>(ctx);
  auto       admin  = std::make_shared<fieldwake::service::AdminService>(ctx);

  fieldwake::grpc::IngestServer ingest_server(ingest, std::chrono::milliseconds(10));
  fieldwake::grpc::AdminServer  admin_server(admin);

  fieldwake::v1::DeliverRequest req;
  req.set_topic("ESP32CAM/aa:bb:cc:dd:ee:ff/status");
  req.set_payload(R"({"status":"alive","pendingImg":0})");
  fieldwake::v1::DeliverResponse resp;
  ::grpc::ServerContext          ctx1;
  assert(ingest_server.Deliver(&ctx1, &req, &resp).ok());
  assert(resp.disposition() == fieldwake::v1::DELIVERY_DISPOSITION_ACCEPTED);
  assert(resp.detail() == "sleep_only");

  fieldwake::v1::ListWakeEventsRequest list_req;
  list_req.set_device_id("aa:bb:cc:dd:ee:ff");
  fieldwake::v1::ListWakeEventsResponse list_resp;
  ::grpc::ServerContext                 ctx2;
  assert(admin_server.ListWakeEvents(&ctx2, &list_req, &list_resp).ok());
  assert(list_resp.wake_events_size() == 1);
  assert(list_resp.wake_events(0).state() == fieldwake::v1::PROTOCOL_STATE_SLEEP_ONLY);

  fieldwake::v1::StatsRequest  stats_req;
  fieldwake::v1::StatsResponse stats_resp;
  ::grpc::ServerContext        ctx3;
  assert(admin_server.Stats(&ctx3, &stats_req, &stats_resp).ok());
  assert(stats_resp.devices() == 1);
  assert(stats_resp.wake_events_by_state().at("sleep_only") == 1);

  fieldwake::v1::SweepNowRequest  sweep_req;
  fieldwake::v1::SweepNowResponse sweep_resp;
  ::grpc::ServerContext           ctx4;
  assert(admin_server.SweepNow(&ctx4, &sweep_req, &sweep_resp).ok());
  assert(sweep_resp.transfers_failed() == 0);
  assert(sweep_resp.wakes_failed() == 0);
  assert(sweep_resp.missing_requested() == 0);
  assert(sweep_resp.rows_pruned() == 0);
}

} // namespace

int main() {
  TestErrorMapping();
  TestMissingWakeEventReturnsNotFound();
  TestMissingTransferAndDeviceReturnNotFound();
  TestMalformedDeliveryIsDiscardedNotAnError();
  TestDeliveryRoutesAndAdminReadsBack();

  std::cout << "fieldwake_unit_grpc_status: pass\n";
  return 0;
}
