#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "outflow/v1.hpp"

using namespace outflow::v1;

static void Usage() {
  std::cout << "Usage: outflowctl --config <config.yaml> <command> [args...]\n"
            << "\n"
            << "Engine:\n"
            << "  create-request <service_request> <part> <technician> <qty> [normal|urgent|emergency] [justification]\n"
            << "  check-stock <part> <store> <qty>\n"
            << "  approve <request> <approver> [comments]\n"
            << "  reject <request> <approver> <reason>\n"
            << "  escalate <request> <approver> <target_level> [comments]\n"
            << "  issue <request>\n"
            << "  install <service_request> <part> <technician> <qty> [unit_cost] [serial]\n"
            << "  return <service_request> <part> <qty> <good|damaged|defective> [reason]\n"
            << "  cost <service_request>\n"
            << "  history <request>\n"
            << "  get <request>\n"
            << "  list [service_request]\n"
            << "\n"
            << "Admin:\n"
            << "  register-part <id> <name> <category> <unit_cost> <selling_price> [warranty_months]\n"
            << "  register-service <id> <store> <technician> [labor_hours]\n"
            << "  set-limit <technician> <category|-> <part|-> <max_value> <auto_approve_below> [approver_level]\n"
            << "  grant-role <principal> <role> <level>\n"
            << "  revoke-role <principal> <role>\n"
            << "  init-stock <part> <store> <qty>\n"
            << "  receive-stock <part> <store> <qty> [unit_cost]\n"
            << "  adjust-stock <part> <store> <physical_count> <reason>\n"
            << "  transfer <part> <from_store> <to_store> <qty>\n"
            << "  movements <part> <store>\n"
            << "  release-expired\n";
}

static std::int64_t ParseInt(const std::string& value) {
  try {
    size_t pos    = 0;
    auto   parsed = std::stoll(value, &pos);
    if (pos == value.size()) return parsed;
  } catch (const std::exception&) {
  }
  std::cerr << "invalid integer: " << value << "\n";
  std::exit(1);
}

static std::optional<Urgency> ParseUrgency(const std::string& value) {
  if (value == "normal") return URGENCY_NORMAL;
  if (value == "urgent") return URGENCY_URGENT;
  if (value == "emergency") return URGENCY_EMERGENCY;
  return std::nullopt;
}

static std::optional<ReturnCondition> ParseCondition(const std::string& value) {
  if (value == "good") return RETURN_CONDITION_GOOD;
  if (value == "damaged") return RETURN_CONDITION_DAMAGED;
  if (value == "defective") return RETURN_CONDITION_DEFECTIVE;
  return std::nullopt;
}

// "-" stands for an unset optional identifier.
static std::string OptionalId(const std::string& value) {
  return value == "-" ? std::string() : value;
}

static void Print(const google::protobuf::Message& message) {
  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.ToString() << "\n";
    std::exit(2);
  }
  std::cout << json;
}

static int Run(outflow::factory::Application& app, const std::string& cmd, int argc, char** argv, int first) {
  auto& flow  = *app.outward_flow_service;
  auto& admin = *app.admin_service;

  const int nargs = argc - first;
  auto      arg   = [&](int i) { return std::string(argv[first + i]); };
  auto      need  = [&](int n) {
    if (nargs < n) {
      Usage();
      std::exit(1);
    }
  };

  // ------------------------------------------------------------

  if (cmd == "create-request") {
    need(4);
    CreatePartRequestRequest req;
    req.set_service_request_id(arg(0));
    req.set_spare_part_id(arg(1));
    req.set_technician_id(arg(2));
    req.set_requested_quantity(ParseInt(arg(3)));
    req.set_urgency(URGENCY_NORMAL);
    if (nargs >= 5) {
      auto urgency = ParseUrgency(arg(4));
      if (!urgency.has_value()) {
        std::cerr << "unsupported urgency: " << arg(4) << "\n";
        return 1;
      }
      req.set_urgency(urgency.value());
    }
    if (nargs >= 6) req.set_justification(arg(5));
    Print(flow.CreatePartRequest(req));
    return 0;
  }

  if (cmd == "check-stock") {
    need(3);
    CheckStockAvailabilityRequest req;
    req.set_spare_part_id(arg(0));
    req.set_store_id(arg(1));
    req.set_quantity(ParseInt(arg(2)));
    Print(flow.CheckStockAvailability(req));
    return 0;
  }

  if (cmd == "approve") {
    need(2);
    ApproveRequestRequest req;
    req.set_request_id(arg(0));
    req.set_approver_id(arg(1));
    if (nargs >= 3) req.set_comments(arg(2));
    Print(flow.ApproveRequest(req));
    return 0;
  }

  if (cmd == "reject") {
    need(3);
    RejectRequestRequest req;
    req.set_request_id(arg(0));
    req.set_approver_id(arg(1));
    req.set_reason(arg(2));
    Print(flow.RejectRequest(req));
    return 0;
  }

  if (cmd == "escalate") {
    need(3);
    EscalateRequestRequest req;
    req.set_request_id(arg(0));
    req.set_approver_id(arg(1));
    req.set_target_level(static_cast<std::uint32_t>(ParseInt(arg(2))));
    if (nargs >= 4) req.set_comments(arg(3));
    Print(flow.EscalateRequest(req));
    return 0;
  }

  if (cmd == "issue") {
    need(1);
    IssueRequestRequest req;
    req.set_request_id(arg(0));
    Print(flow.IssueRequest(req));
    return 0;
  }

  if (cmd == "install") {
    need(4);
    InstallPartRequest req;
    req.set_service_request_id(arg(0));
    req.set_spare_part_id(arg(1));
    req.set_technician_id(arg(2));
    req.set_quantity(ParseInt(arg(3)));
    if (nargs >= 5) req.set_unit_cost(ParseInt(arg(4)));
    if (nargs >= 6) req.set_serial_number(arg(5));
    Print(flow.InstallPart(req));
    return 0;
  }

  if (cmd == "return") {
    need(4);
    auto condition = ParseCondition(arg(3));
    if (!condition.has_value()) {
      std::cerr << "unsupported condition: " << arg(3) << "\n";
      return 1;
    }
    ReturnPartsRequest req;
    req.set_service_request_id(arg(0));
    auto* item = req.add_returns();
    item->set_spare_part_id(arg(1));
    item->set_quantity(ParseInt(arg(2)));
    item->set_condition(condition.value());
    if (nargs >= 5) item->set_reason(arg(4));
    Print(flow.ReturnParts(req));
    return 0;
  }

  if (cmd == "cost") {
    need(1);
    CalculateServiceCostRequest req;
    req.set_service_request_id(arg(0));
    Print(flow.CalculateServiceCost(req));
    return 0;
  }

  if (cmd == "history") {
    need(1);
    GetApprovalHistoryRequest req;
    req.set_request_id(arg(0));
    Print(flow.GetApprovalHistory(req));
    return 0;
  }

  if (cmd == "get") {
    need(1);
    GetPartRequestRequest req;
    req.set_request_id(arg(0));
    Print(flow.GetPartRequest(req));
    return 0;
  }

  if (cmd == "list") {
    ListPartRequestsRequest req;
    if (nargs >= 1) req.set_service_request_id(arg(0));
    Print(flow.ListPartRequests(req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "register-part") {
    need(5);
    RegisterSparePartRequest req;
    req.set_id(arg(0));
    req.set_name(arg(1));
    req.set_category_id(arg(2));
    req.set_unit_cost(ParseInt(arg(3)));
    req.set_selling_price(ParseInt(arg(4)));
    if (nargs >= 6) req.set_warranty_months(static_cast<std::uint32_t>(ParseInt(arg(5))));
    admin.RegisterSparePart(req);
    std::cout << "registered\n";
    return 0;
  }

  if (cmd == "register-service") {
    need(3);
    RegisterServiceRequestRequest req;
    req.set_id(arg(0));
    req.set_store_id(arg(1));
    req.set_technician_id(arg(2));
    if (nargs >= 4) req.set_labor_hours(std::stod(arg(3)));
    admin.RegisterServiceRequest(req);
    std::cout << "registered\n";
    return 0;
  }

  if (cmd == "set-limit") {
    need(5);
    SetTechnicianLimitRequest req;
    req.set_technician_id(arg(0));
    req.set_category_id(OptionalId(arg(1)));
    req.set_spare_part_id(OptionalId(arg(2)));
    req.set_max_value_per_request(ParseInt(arg(3)));
    req.set_auto_approve_below(ParseInt(arg(4)));
    req.set_requires_approval(true);
    req.set_approver_level(nargs >= 6 ? static_cast<std::uint32_t>(ParseInt(arg(5))) : 1);
    req.set_active(true);
    Print(admin.SetTechnicianLimit(req));
    return 0;
  }

  if (cmd == "grant-role") {
    need(3);
    GrantRoleRequest req;
    req.set_principal_id(arg(0));
    req.set_role(arg(1));
    req.set_approval_level(static_cast<std::uint32_t>(ParseInt(arg(2))));
    req.set_granted_by("outflowctl");
    admin.GrantRole(req);
    std::cout << "granted\n";
    return 0;
  }

  if (cmd == "revoke-role") {
    need(2);
    RevokeRoleRequest req;
    req.set_principal_id(arg(0));
    req.set_role(arg(1));
    admin.RevokeRole(req);
    std::cout << "revoked\n";
    return 0;
  }

  if (cmd == "init-stock") {
    need(3);
    InitializeStockRequest req;
    req.set_spare_part_id(arg(0));
    req.set_store_id(arg(1));
    req.set_initial_stock(ParseInt(arg(2)));
    req.set_actor("outflowctl");
    Print(admin.InitializeStock(req));
    return 0;
  }

  if (cmd == "receive-stock") {
    need(3);
    ReceiveStockRequest req;
    req.set_spare_part_id(arg(0));
    req.set_store_id(arg(1));
    req.set_quantity(ParseInt(arg(2)));
    if (nargs >= 4) req.set_unit_cost(ParseInt(arg(3)));
    req.set_actor("outflowctl");
    Print(admin.ReceiveStock(req));
    return 0;
  }

  if (cmd == "adjust-stock") {
    need(4);
    AdjustStockRequest req;
    req.set_spare_part_id(arg(0));
    req.set_store_id(arg(1));
    req.set_physical_count(ParseInt(arg(2)));
    req.set_reason(arg(3));
    req.set_actor("outflowctl");
    Print(admin.AdjustStock(req));
    return 0;
  }

  if (cmd == "transfer") {
    need(4);
    TransferStockRequest req;
    req.set_spare_part_id(arg(0));
    req.set_from_store_id(arg(1));
    req.set_to_store_id(arg(2));
    req.set_quantity(ParseInt(arg(3)));
    req.set_actor("outflowctl");
    Print(admin.TransferStock(req));
    return 0;
  }

  if (cmd == "movements") {
    need(2);
    ListStockMovementsRequest req;
    req.set_spare_part_id(arg(0));
    req.set_store_id(arg(1));
    Print(admin.ListStockMovements(req));
    return 0;
  }

  if (cmd == "release-expired") {
    Print(admin.ReleaseExpiredReservations());
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    auto config = outflow::config::ConfigLoader::LoadFromYaml(config_path);
    outflow::observability::InitializeLogging(config);

    auto app = outflow::factory::Build(config);
    auto rc  = Run(app, cmd, argc, argv, 4);

    outflow::observability::ShutdownLogging();
    return rc;
  } catch (const outflow::util::Error& e) {
    std::cerr << outflow::util::ToString(e.Code()) << ": " << e.what() << "\n";
    outflow::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << "\n";
    outflow::observability::ShutdownLogging();
    return 2;
  }
}
