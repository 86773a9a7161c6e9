#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "settlement/v1.hpp"

using namespace settlement::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  settlementctl <addr> register-patent <caller> <royalty_rate_bps> <validity_years> <patent_hash>\n"
            << "  settlementctl <addr> request-license <caller> <patent_id> <royalty_rate_bps> <duration_days>\n"
            << "  settlementctl <addr> approve-license <caller> <license_id> <duration_days>\n"
            << "  settlementctl <addr> deposit <account> <amount>\n"
            << "  settlementctl <addr> account <account>\n"
            << "  settlementctl <addr> seal <value>\n"
            << "  settlementctl <addr> start-bidding <caller> <patent_id> <hours>\n"
            << "  settlementctl <addr> bid <caller> <patent_id> <handle> <escrow>\n"
            << "  settlementctl <addr> finalize <caller> <patent_id>\n"
            << "  settlementctl <addr> session <patent_id>\n"
            << "  settlementctl <addr> pay-royalty <caller> <license_id> <revenue_handle> <amount> <period>\n"
            << "  settlementctl <addr> verify <caller> <license_id> <payment_index>\n"
            << "  settlementctl <addr> payment <license_id> <payment_index>\n"
            << "  settlementctl <addr> deliver [request_id]\n"
            << "  settlementctl <addr> request <request_id>\n"
            << "  settlementctl <addr> claim-timeout <caller> <request_id>\n"
            << "  settlementctl <addr> claim <caller> <request_id>\n"
            << "  settlementctl <addr> withdraw <caller>\n"
            << "  settlementctl <addr> refund-balance <account>\n"
            << "  settlementctl <addr> events [after_sequence] [limit]\n"
            << "  settlementctl <addr> stats\n";
}

static bool Failed(const grpc::Status& status) {
  if (status.ok()) return false;
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return true;
}

static const char* PhaseName(SessionPhase phase) {
  switch (phase) {
    case SESSION_PHASE_OPEN:
      return "open";
    case SESSION_PHASE_AWAITING_RESULT:
      return "awaiting_result";
    case SESSION_PHASE_RESOLVED:
      return "resolved";
    case SESSION_PHASE_UNRESOLVED:
      return "unresolved";
    default:
      return "unspecified";
  }
}

static const char* StatusName(RequestStatus status) {
  switch (status) {
    case REQUEST_STATUS_PENDING:
      return "pending";
    case REQUEST_STATUS_COMPLETED:
      return "completed";
    case REQUEST_STATUS_FAILED:
      return "failed";
    case REQUEST_STATUS_TIMED_OUT:
      return "timed_out";
    default:
      return "unspecified";
  }
}

static const char* OutcomeName(VerificationOutcome outcome) {
  switch (outcome) {
    case VERIFICATION_OUTCOME_VALID:
      return "valid";
    case VERIFICATION_OUTCOME_INVALID:
      return "invalid";
    default:
      return "unverified";
  }
}

static std::uint64_t U64(const char* arg) {
  return std::stoull(arg);
}

static std::uint32_t U32(const char* arg) {
  return static_cast<std::uint32_t>(std::stoul(arg));
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto registry_stub = RegistryService::NewStub(channel);
  auto auction_stub  = AuctionService::NewStub(channel);
  auto royalty_stub  = RoyaltyService::NewStub(channel);
  auto refund_stub   = RefundService::NewStub(channel);
  auto admin_stub    = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------
    // registry
    // ------------------------------------------------------------

    if (cmd == "register-patent") {
      if (argc < 7) return 1;

      RegisterPatentRequest req;
      req.set_caller(argv[3]);
      req.set_royalty_rate(U32(argv[4]));
      req.set_validity_years(U32(argv[5]));
      req.set_patent_hash(argv[6]);

      RegisterPatentResponse resp;
      if (Failed(registry_stub->RegisterPatent(&ctx, req, &resp))) return 2;

      std::cout << "patent_id=" << resp.patent_id() << "\n";
      return 0;
    }

    if (cmd == "request-license") {
      if (argc < 7) return 1;

      RequestLicenseRequest req;
      req.set_caller(argv[3]);
      req.set_patent_id(U64(argv[4]));
      req.set_proposed_royalty_rate(U32(argv[5]));
      req.set_duration_days(U32(argv[6]));

      RequestLicenseResponse resp;
      if (Failed(registry_stub->RequestLicense(&ctx, req, &resp))) return 2;

      std::cout << "license_id=" << resp.license_id() << "\n";
      return 0;
    }

    if (cmd == "approve-license") {
      if (argc < 6) return 1;

      ApproveLicenseRequest req;
      req.set_caller(argv[3]);
      req.set_license_id(U64(argv[4]));
      req.set_duration_days(U32(argv[5]));

      ApproveLicenseResponse resp;
      if (Failed(registry_stub->ApproveLicense(&ctx, req, &resp))) return 2;

      std::cout << "approved\n";
      return 0;
    }

    // ------------------------------------------------------------
    // accounts and sealing
    // ------------------------------------------------------------

    if (cmd == "deposit") {
      if (argc < 5) return 1;

      DepositRequest req;
      req.set_account(argv[3]);
      req.set_amount(U64(argv[4]));

      DepositResponse resp;
      if (Failed(admin_stub->Deposit(&ctx, req, &resp))) return 2;

      std::cout << "balance=" << resp.balance() << "\n";
      return 0;
    }

    if (cmd == "account") {
      if (argc < 4) return 1;

      GetAccountRequest req;
      req.set_account(argv[3]);

      GetAccountResponse resp;
      if (Failed(admin_stub->GetAccount(&ctx, req, &resp))) return 2;

      std::cout << "balance=" << resp.balance() << "\n";
      std::cout << "refundable=" << resp.refundable() << "\n";
      std::cout << "accepts_payouts=" << (resp.accepts_payouts() ? "true" : "false") << "\n";
      return 0;
    }

    if (cmd == "seal") {
      if (argc < 4) return 1;

      SealValueRequest req;
      req.set_value(U64(argv[3]));

      SealValueResponse resp;
      if (Failed(admin_stub->SealValue(&ctx, req, &resp))) return 2;

      std::cout << resp.handle() << "\n";
      return 0;
    }

    // ------------------------------------------------------------
    // bidding
    // ------------------------------------------------------------

    if (cmd == "start-bidding") {
      if (argc < 6) return 1;

      StartBiddingRequest req;
      req.set_caller(argv[3]);
      req.set_asset_id(U64(argv[4]));
      req.set_duration_hours(U32(argv[5]));

      StartBiddingResponse resp;
      if (Failed(auction_stub->StartBidding(&ctx, req, &resp))) return 2;

      std::cout << "end_time=" << resp.session().end_time().seconds() << "\n";
      return 0;
    }

    if (cmd == "bid") {
      if (argc < 7) return 1;

      SubmitBidRequest req;
      req.set_caller(argv[3]);
      req.set_asset_id(U64(argv[4]));
      req.set_encrypted_amount(argv[5]);
      req.set_escrow(U64(argv[6]));

      SubmitBidResponse resp;
      if (Failed(auction_stub->SubmitBid(&ctx, req, &resp))) return 2;

      std::cout << "bid_index=" << resp.bid_index() << "\n";
      return 0;
    }

    if (cmd == "finalize") {
      if (argc < 5) return 1;

      FinalizeBiddingRequest req;
      req.set_caller(argv[3]);
      req.set_asset_id(U64(argv[4]));

      FinalizeBiddingResponse resp;
      if (Failed(auction_stub->FinalizeBidding(&ctx, req, &resp))) return 2;

      std::cout << "request_id=" << resp.request_id() << "\n";
      return 0;
    }

    if (cmd == "session") {
      if (argc < 4) return 1;

      GetSessionRequest req;
      req.set_asset_id(U64(argv[3]));

      GetSessionResponse resp;
      if (Failed(auction_stub->GetSession(&ctx, req, &resp))) return 2;

      const auto& session = resp.session();
      std::cout << "phase=" << PhaseName(session.phase()) << "\n";
      std::cout << "bids=" << session.bids_size() << "\n";
      for (const auto& bid : session.bids()) {
        std::cout << "  bidder=" << bid.bidder() << " escrow=" << bid.escrow() << "\n";
      }
      if (session.request_id() != 0) std::cout << "request_id=" << session.request_id() << "\n";
      if (!session.winner().empty()) std::cout << "winner=" << session.winner() << "\n";
      return 0;
    }

    // ------------------------------------------------------------
    // royalties
    // ------------------------------------------------------------

    if (cmd == "pay-royalty") {
      if (argc < 8) return 1;

      SubmitRoyaltyPaymentRequest req;
      req.set_caller(argv[3]);
      req.set_license_id(U64(argv[4]));
      req.set_revenue_handle(argv[5]);
      req.set_amount(U64(argv[6]));
      req.set_reporting_period(U32(argv[7]));

      SubmitRoyaltyPaymentResponse resp;
      if (Failed(royalty_stub->SubmitRoyaltyPayment(&ctx, req, &resp))) return 2;

      std::cout << "payment_index=" << resp.payment_index() << "\n";
      return 0;
    }

    if (cmd == "verify") {
      if (argc < 6) return 1;

      RequestVerificationRequest req;
      req.set_caller(argv[3]);
      req.set_license_id(U64(argv[4]));
      req.set_payment_index(U64(argv[5]));

      RequestVerificationResponse resp;
      if (Failed(royalty_stub->RequestVerification(&ctx, req, &resp))) return 2;

      std::cout << "request_id=" << resp.request_id() << "\n";
      return 0;
    }

    if (cmd == "payment") {
      if (argc < 5) return 1;

      GetPaymentRequest req;
      req.set_license_id(U64(argv[3]));
      req.set_payment_index(U64(argv[4]));

      GetPaymentResponse resp;
      if (Failed(royalty_stub->GetPayment(&ctx, req, &resp))) return 2;

      std::cout << "paid=" << resp.payment().paid_amount() << "\n";
      std::cout << "outcome=" << OutcomeName(resp.payment().outcome()) << "\n";
      std::cout << "expected=" << resp.payment().expected_amount() << "\n";
      return 0;
    }

    // ------------------------------------------------------------
    // requests and refunds
    // ------------------------------------------------------------

    if (cmd == "deliver") {
      DeliverPendingRequest req;
      if (argc >= 4) req.set_request_id(U64(argv[3]));

      DeliverPendingResponse resp;
      if (Failed(admin_stub->DeliverPending(&ctx, req, &resp))) return 2;

      std::cout << "delivered=" << resp.delivered() << "\n";
      return 0;
    }

    if (cmd == "request") {
      if (argc < 4) return 1;

      GetRequestRequest req;
      req.set_request_id(U64(argv[3]));

      GetRequestResponse resp;
      if (Failed(admin_stub->GetRequest(&ctx, req, &resp))) return 2;

      std::cout << "status=" << StatusName(resp.request().status()) << "\n";
      std::cout << "issuer=" << resp.request().issuer() << "\n";
      if (!resp.request().failure_reason().empty()) {
        std::cout << "failure_reason=" << resp.request().failure_reason() << "\n";
      }
      return 0;
    }

    if (cmd == "claim-timeout") {
      if (argc < 5) return 1;

      ClaimTimeoutRequest req;
      req.set_caller(argv[3]);
      req.set_request_id(U64(argv[4]));

      ClaimTimeoutResponse resp;
      if (Failed(refund_stub->ClaimTimeout(&ctx, req, &resp))) return 2;

      std::cout << "timed_out\n";
      return 0;
    }

    if (cmd == "claim") {
      if (argc < 5) return 1;

      ClaimRequest req;
      req.set_caller(argv[3]);
      req.set_request_id(U64(argv[4]));

      ClaimResponse resp;
      if (Failed(refund_stub->Claim(&ctx, req, &resp))) return 2;

      std::cout << "withdrawn=" << resp.withdrawn() << "\n";
      if (!resp.withdraw_error().empty()) std::cout << "withdraw_error=" << resp.withdraw_error() << "\n";
      return 0;
    }

    if (cmd == "withdraw") {
      if (argc < 4) return 1;

      WithdrawRequest req;
      req.set_caller(argv[3]);

      WithdrawResponse resp;
      if (Failed(refund_stub->Withdraw(&ctx, req, &resp))) return 2;

      std::cout << "amount=" << resp.amount() << "\n";
      return 0;
    }

    if (cmd == "refund-balance") {
      if (argc < 4) return 1;

      GetRefundBalanceRequest req;
      req.set_account(argv[3]);

      GetRefundBalanceResponse resp;
      if (Failed(refund_stub->GetRefundBalance(&ctx, req, &resp))) return 2;

      std::cout << "amount=" << resp.amount() << "\n";
      return 0;
    }

    // ------------------------------------------------------------
    // admin
    // ------------------------------------------------------------

    if (cmd == "events") {
      ListEventsRequest req;
      if (argc >= 4) req.set_after_sequence(U64(argv[3]));
      if (argc >= 5) req.set_limit(U32(argv[4]));

      ListEventsResponse resp;
      if (Failed(admin_stub->ListEvents(&ctx, req, &resp))) return 2;

      for (const auto& event : resp.events()) {
        std::cout << event.sequence() << " " << event.kind();
        for (const auto& attr : event.attributes()) {
          std::cout << " " << attr.key() << "=" << attr.value();
        }
        std::cout << "\n";
      }
      return 0;
    }

    if (cmd == "stats") {
      StatsRequest  req;
      StatsResponse resp;
      if (Failed(admin_stub->Stats(&ctx, req, &resp))) return 2;

      std::cout << "pending=" << resp.requests_pending() << "\n";
      std::cout << "completed=" << resp.requests_completed() << "\n";
      std::cout << "failed=" << resp.requests_failed() << "\n";
      std::cout << "timed_out=" << resp.requests_timed_out() << "\n";
      std::cout << "custody=" << resp.custody_balance() << "\n";
      std::cout << "active_escrow=" << resp.active_escrow() << "\n";
      std::cout << "refundable=" << resp.refundable_total() << "\n";
      std::cout << "balanced=" << (resp.balanced() ? "true" : "false") << "\n";
      return 0;
    }
  } catch (const std::logic_error& e) {
    // std::stoull / std::stoul on a malformed number
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
