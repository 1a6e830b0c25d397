#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "routebid/v1/admin_service.grpc.pb.h"
#include "routebid/v1/bid_service.grpc.pb.h"
#include "routebid/v1/match_service.grpc.pb.h"
#include "routebid/v1/package_service.grpc.pb.h"
#include "routebid/v1/route_service.grpc.pb.h"

using namespace routebid::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  routebidctl <addr> create-package <sender> <size> <weight_kg> <pickup_lat> <pickup_lng> <dropoff_lat> <dropoff_lng> [price]\n"
            << "  routebidctl <addr> get-package <package_id>\n"
            << "  routebidctl <addr> list-packages [status] [sender]\n"
            << "  routebidctl <addr> cancel <package_id> <sender>\n"
            << "  routebidctl <addr> pickup-intent <package_id> <courier>\n"
            << "  routebidctl <addr> pickup <package_id> <courier>\n"
            << "  routebidctl <addr> deliver <package_id> <proof_ref>\n"
            << "  routebidctl <addr> fail <package_id> <reason>\n"
            << "  routebidctl <addr> bid <package_id> <courier> <price> [message]\n"
            << "  routebidctl <addr> withdraw <bid_id> <courier>\n"
            << "  routebidctl <addr> select <bid_id> <sender>\n"
            << "  routebidctl <addr> bids <package_id>\n"
            << "  routebidctl <addr> courier-bids <courier> [status]\n"
            << "  routebidctl <addr> create-route <courier> <start_lat> <start_lng> <end_lat> <end_lng> <max_deviation_km>\n"
            << "  routebidctl <addr> deactivate-route <route_id> <courier>\n"
            << "  routebidctl <addr> routes <courier>\n"
            << "  routebidctl <addr> matches <route_id> [limit]\n"
            << "  routebidctl <addr> eligibility <courier> <true|false>\n"
            << "  routebidctl <addr> sweep\n";
}

static std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

// Enum names are accepted without their prefix, e.g. "open_for_bids".
template <typename Enum, typename ParseFn>
static bool ParseEnumArg(const std::string& prefix, const std::string& arg, ParseFn parse, Enum* out) {
  return parse(prefix + Upper(arg), out);
}

static std::string Strip(const std::string& name, const std::string& prefix) {
  return name.rfind(prefix, 0) == 0 ? name.substr(prefix.size()) : name;
}

static GeoPoint Point(const char* lat, const char* lng) {
  GeoPoint p;
  p.set_lat(std::stod(lat));
  p.set_lng(std::stod(lng));
  return p;
}

static void Print(const Package& p) {
  std::cout << "id=" << p.id() << " status=" << Strip(PackageStatus_Name(p.status()), "PACKAGE_STATUS_") << " sender=" << p.sender_id();
  if (!p.courier_id().empty()) std::cout << " courier=" << p.courier_id();
  if (!p.selected_bid_id().empty()) std::cout << " selected_bid=" << p.selected_bid_id();
  if (p.has_bidding_deadline()) std::cout << " deadline=" << p.bidding_deadline().seconds();
  std::cout << " extensions=" << p.deadline_extension_count() << " version=" << p.version() << "\n";
}

static void Print(const Bid& b) {
  std::cout << "id=" << b.id() << " package=" << b.package_id() << " courier=" << b.courier_id() << " price=" << b.proposed_price()
            << " status=" << Strip(BidStatus_Name(b.status()), "BID_STATUS_") << "\n";
}

static void Print(const Route& r) {
  std::cout << "id=" << r.id() << " courier=" << r.courier_id() << " max_deviation_km=" << r.max_deviation_km()
            << " active=" << (r.is_active() ? "true" : "false") << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto package_stub = PackageService::NewStub(channel);
  auto bid_stub     = BidService::NewStub(channel);
  auto route_stub   = RouteService::NewStub(channel);
  auto match_stub   = MatchService::NewStub(channel);
  auto admin_stub   = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------
    // Packages
    // ------------------------------------------------------------

    if (cmd == "create-package") {
      if (argc < 10) return 1;

      CreatePackageRequest req;
      req.set_sender_id(argv[3]);
      PackageSize size;
      if (!ParseEnumArg("PACKAGE_SIZE_", argv[4], PackageSize_Parse, &size)) {
        std::cerr << "unsupported size: " << argv[4] << "\n";
        return 1;
      }
      req.set_size(size);
      req.set_weight_kg(std::stod(argv[5]));
      *req.mutable_pickup()  = Point(argv[6], argv[7]);
      *req.mutable_dropoff() = Point(argv[8], argv[9]);
      req.set_pickup_address(std::string(argv[6]) + "," + argv[7]);
      req.set_dropoff_address(std::string(argv[8]) + "," + argv[9]);
      if (argc >= 11) req.set_offered_price(std::stod(argv[10]));

      PackageResponse resp;
      auto            status = package_stub->CreatePackage(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.package());
      return 0;
    }

    if (cmd == "get-package") {
      if (argc < 4) return 1;

      GetPackageRequest req;
      req.set_package_id(argv[3]);

      PackageResponse resp;
      auto            status = package_stub->GetPackage(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.package());
      return 0;
    }

    if (cmd == "list-packages") {
      ListPackagesRequest req;
      if (argc >= 4) {
        PackageStatus filter;
        if (!ParseEnumArg("PACKAGE_STATUS_", argv[3], PackageStatus_Parse, &filter)) {
          std::cerr << "unsupported status: " << argv[3] << "\n";
          return 1;
        }
        req.set_status(filter);
      }
      if (argc >= 5) req.set_sender_id(argv[4]);

      ListPackagesResponse resp;
      auto                 status = package_stub->ListPackages(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      for (const auto& p : resp.packages()) Print(p);
      return 0;
    }

    if (cmd == "cancel") {
      if (argc < 5) return 1;

      CancelPackageRequest req;
      req.set_package_id(argv[3]);
      req.set_sender_id(argv[4]);

      PackageResponse resp;
      auto            status = package_stub->CancelPackage(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.package());
      return 0;
    }

    if (cmd == "pickup-intent" || cmd == "pickup") {
      if (argc < 5) return 1;

      CourierActionRequest req;
      req.set_package_id(argv[3]);
      req.set_courier_id(argv[4]);

      PackageResponse resp;
      auto status = cmd == "pickup" ? package_stub->ConfirmPickup(&ctx, req, &resp) : package_stub->ConfirmPickupIntent(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.package());
      return 0;
    }

    if (cmd == "deliver") {
      if (argc < 5) return 1;

      MarkDeliveredRequest req;
      req.set_package_id(argv[3]);
      req.set_proof_reference(argv[4]);

      PackageResponse resp;
      auto            status = package_stub->MarkDelivered(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.package());
      return 0;
    }

    if (cmd == "fail") {
      if (argc < 5) return 1;

      ReportFailureRequest req;
      req.set_package_id(argv[3]);
      req.set_reason(argv[4]);

      PackageResponse resp;
      auto            status = package_stub->ReportFailure(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.package());
      return 0;
    }

    // ------------------------------------------------------------
    // Bids
    // ------------------------------------------------------------

    if (cmd == "bid") {
      if (argc < 6) return 1;

      PlaceBidRequest req;
      req.set_package_id(argv[3]);
      req.set_courier_id(argv[4]);
      req.set_proposed_price(std::stod(argv[5]));
      if (argc >= 7) req.set_message(argv[6]);

      BidResponse resp;
      auto        status = bid_stub->PlaceBid(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.bid());
      return 0;
    }

    if (cmd == "withdraw") {
      if (argc < 5) return 1;

      WithdrawBidRequest req;
      req.set_bid_id(argv[3]);
      req.set_courier_id(argv[4]);

      BidResponse resp;
      auto        status = bid_stub->WithdrawBid(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.bid());
      return 0;
    }

    if (cmd == "select") {
      if (argc < 5) return 1;

      SelectBidRequest req;
      req.set_bid_id(argv[3]);
      req.set_sender_id(argv[4]);

      BidResponse resp;
      auto        status = bid_stub->SelectBid(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.bid());
      return 0;
    }

    if (cmd == "bids") {
      if (argc < 4) return 1;

      ListPackageBidsRequest req;
      req.set_package_id(argv[3]);

      ListBidsResponse resp;
      auto             status = bid_stub->ListPackageBids(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      for (const auto& b : resp.bids()) Print(b);
      return 0;
    }

    if (cmd == "courier-bids") {
      if (argc < 4) return 1;

      ListCourierBidsRequest req;
      req.set_courier_id(argv[3]);
      if (argc >= 5) {
        BidStatus filter;
        if (!ParseEnumArg("BID_STATUS_", argv[4], BidStatus_Parse, &filter)) {
          std::cerr << "unsupported status: " << argv[4] << "\n";
          return 1;
        }
        req.set_status(filter);
      }

      ListBidsResponse resp;
      auto             status = bid_stub->ListCourierBids(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      for (const auto& b : resp.bids()) Print(b);
      return 0;
    }

    // ------------------------------------------------------------
    // Routes and matching
    // ------------------------------------------------------------

    if (cmd == "create-route") {
      if (argc < 9) return 1;

      CreateRouteRequest req;
      req.set_courier_id(argv[3]);
      *req.mutable_start() = Point(argv[4], argv[5]);
      *req.mutable_end()   = Point(argv[6], argv[7]);
      req.set_max_deviation_km(std::stod(argv[8]));

      RouteResponse resp;
      auto          status = route_stub->CreateRoute(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.route());
      return 0;
    }

    if (cmd == "deactivate-route") {
      if (argc < 5) return 1;

      DeactivateRouteRequest req;
      req.set_route_id(argv[3]);
      req.set_courier_id(argv[4]);

      RouteResponse resp;
      auto          status = route_stub->DeactivateRoute(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      Print(resp.route());
      return 0;
    }

    if (cmd == "routes") {
      if (argc < 4) return 1;

      ListRoutesRequest req;
      req.set_courier_id(argv[3]);

      ListRoutesResponse resp;
      auto               status = route_stub->ListRoutes(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      for (const auto& r : resp.routes()) Print(r);
      return 0;
    }

    if (cmd == "matches") {
      if (argc < 4) return 1;

      FindMatchesRequest req;
      req.set_route_id(argv[3]);
      if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

      FindMatchesResponse resp;
      auto                status = match_stub->FindMatches(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      for (const auto& m : resp.matches()) {
        std::cout << "package=" << m.package_id() << " distance_km=" << m.distance_from_route_km() << " detour_km=" << m.estimated_detour_km()
                  << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------
    // Admin
    // ------------------------------------------------------------

    if (cmd == "eligibility") {
      if (argc < 5) return 1;

      SetCourierEligibilityRequest req;
      req.set_courier_id(argv[3]);
      req.set_eligible(std::string(argv[4]) == "true");

      SetCourierEligibilityResponse resp;
      auto                          status = admin_stub->SetCourierEligibility(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      std::cout << "courier=" << resp.courier_id() << " eligible=" << (resp.eligible() ? "true" : "false") << "\n";
      return 0;
    }

    if (cmd == "sweep") {
      RunDeadlineSweepRequest  req;
      RunDeadlineSweepResponse resp;

      auto status = admin_stub->RunDeadlineSweep(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);
      std::cout << "examined=" << resp.examined() << "\n";
      std::cout << "warned=" << resp.warned() << "\n";
      std::cout << "extended=" << resp.extended() << "\n";
      std::cout << "reset=" << resp.reset() << "\n";
      std::cout << "bids_expired=" << resp.bids_expired() << "\n";
      std::cout << "routes_expired=" << resp.routes_expired() << "\n";
      std::cout << "route_bids_withdrawn=" << resp.route_bids_withdrawn() << "\n";
      std::cout << "failures=" << resp.failures() << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    // std::stod / std::stoul on malformed arguments.
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
