#include "wormhole/client/client.hpp"
#include "wormhole/events/components.hpp"
#include "wormhole/events/event_bus.hpp"
#include "wormhole/events/events.hpp"
#include "wormhole/rendezvous/loopback.hpp"

#include "support/fake_rendezvous.hpp"
#include "support/progress_recorder.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using wormhole::client::PhaseKind;
using wormhole::client::ProgressEvent;
using wormhole::client::WormholeClient;
using wormhole::core::ErrorKind;
using wormhole::events::EventBus;
using wormhole::events::MetricsComponent;
using wormhole::rendezvous::Failure;
using wormhole::rendezvous::FailureKind;
using wormhole::testing::FakeRendezvous;
using wormhole::testing::ProgressRecorder;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("wormhole_client_test_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

fs::path write_file(const fs::path& dir, const std::string& name, const std::string& content) {
    const auto path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

// cancel() resets the slot on a background thread.
template<typename Predicate>
bool eventually(Predicate predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace

class WormholeClientTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = create_temp_dir(); }
    void TearDown() override { fs::remove_all(dir_); }

    EventBus bus_;
    MetricsComponent metrics_{bus_};
    std::shared_ptr<FakeRendezvous> fake_ = std::make_shared<FakeRendezvous>();
    WormholeClient client_{fake_, bus_};
    fs::path dir_;
};

// ──────────────────────────────────────────────────────────
// Preconditions
// ──────────────────────────────────────────────────────────

TEST_F(WormholeClientTest, IdleOperationsFailWithoutNetworkActivity) {
    const auto file = write_file(dir_, "a.txt", "hello");

    auto sent = client_.send_file(file.string(), nullptr);
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind(), ErrorKind::NoActiveSession);

    auto accepted = client_.accept_transfer(dir_.string(), nullptr);
    ASSERT_TRUE(accepted.is_error());
    EXPECT_EQ(accepted.error().kind(), ErrorKind::NoActiveSession);

    auto rejected = client_.reject_transfer();
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().kind(), ErrorKind::NoActiveSession);

    EXPECT_EQ(fake_->counters.network_calls(), 0);
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
    EXPECT_EQ(metrics_.get_stats().failures.load(), 3u);
}

TEST_F(WormholeClientTest, MismatchedCallDiscardsPhase) {
    ASSERT_TRUE(client_.create_send_code().is_ok());
    ASSERT_EQ(client_.phase(), PhaseKind::MailboxReady);

    auto accepted = client_.accept_transfer(dir_.string(), nullptr);
    ASSERT_TRUE(accepted.is_error());
    EXPECT_EQ(accepted.error().kind(), ErrorKind::NoActiveSession);
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
}

// ──────────────────────────────────────────────────────────
// create_send_code / send_file
// ──────────────────────────────────────────────────────────

TEST_F(WormholeClientTest, CreateSendCodeHonoursLength) {
    for (std::size_t length = 1; length <= 5; ++length) {
        auto code = client_.create_send_code(length);
        ASSERT_TRUE(code.is_ok()) << code.error().message();

        auto parsed = wormhole::rendezvous::parse_code(code.value());
        ASSERT_TRUE(parsed.is_ok()) << parsed.error();
        EXPECT_EQ(parsed.value().word_count(), length);
    }

    auto default_code = client_.create_send_code();
    ASSERT_TRUE(default_code.is_ok());
    EXPECT_EQ(wormhole::rendezvous::parse_code(default_code.value()).value().word_count(), 2u);

    EXPECT_EQ(client_.phase(), PhaseKind::MailboxReady);
    EXPECT_EQ(metrics_.get_stats().codes_allocated.load(), 6u);
}

TEST_F(WormholeClientTest, CreateSendCodeUsesConfiguredDefaultLength) {
    wormhole::core::ClientConfig config;
    config.code_length = 4;
    WormholeClient client(fake_, bus_, config);

    auto code = client.create_send_code();
    ASSERT_TRUE(code.is_ok());
    EXPECT_EQ(wormhole::rendezvous::parse_code(code.value()).value().word_count(), 4u);
}

TEST_F(WormholeClientTest, CreateSendCodeFailureIsConnectionFailed) {
    fake_->script.allocate_failure = Failure{FailureKind::Network, "mailbox server unreachable"};

    auto code = client_.create_send_code();
    ASSERT_TRUE(code.is_error());
    EXPECT_EQ(code.error().kind(), ErrorKind::ConnectionFailed);
    EXPECT_NE(code.error().detail().find("mailbox server unreachable"), std::string::npos);
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
}

TEST_F(WormholeClientTest, OversizedCodeLengthIsConnectionFailed) {
    using wormhole::core::kMaxCodeLength;
    auto relay = std::make_shared<wormhole::rendezvous::LoopbackRelay>(7);
    WormholeClient client(std::make_shared<wormhole::rendezvous::LoopbackRendezvous>(relay), bus_);

    ASSERT_TRUE(client.create_send_code(kMaxCodeLength).is_ok());
    ASSERT_EQ(client.phase(), PhaseKind::MailboxReady);

    for (const std::size_t length : {kMaxCodeLength + 1, std::numeric_limits<std::size_t>::max()}) {
        auto code = client.create_send_code(length);
        ASSERT_TRUE(code.is_error());
        EXPECT_EQ(code.error().kind(), ErrorKind::ConnectionFailed);
    }

    // The session from the successful call survives the failed ones.
    EXPECT_EQ(client.phase(), PhaseKind::MailboxReady);
    EXPECT_EQ(relay->open_nameplates(), 1u);
}

TEST_F(WormholeClientTest, SendFileStreamsAndCompletesOnce) {
    const auto file = write_file(dir_, "ten.bin", "0123456789");
    ASSERT_TRUE(client_.create_send_code(3).is_ok());

    ProgressRecorder recorder;
    auto sent = client_.send_file(file.string(), recorder.handler());
    ASSERT_TRUE(sent.is_ok()) << sent.error().message();
    ASSERT_TRUE(recorder.wait_for_completion());

    const auto samples = recorder.samples();
    ASSERT_FALSE(samples.empty());
    EXPECT_EQ(samples.back(), ProgressEvent::completed(10));
    for (std::size_t i = 1; i < samples.size(); ++i) {
        EXPECT_LE(samples[i - 1].transferred, samples[i].transferred);
    }

    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
    EXPECT_EQ(fake_->last_relay_hints.size(), 1u);
    EXPECT_EQ(metrics_.get_stats().files_sent.load(), 1u);
    EXPECT_EQ(metrics_.get_stats().bytes_sent.load(), 10u);
}

TEST_F(WormholeClientTest, SendFileDropsRegressingSamples) {
    const auto file = write_file(dir_, "ten.bin", "0123456789");
    fake_->script.send_progress = {{4, 10}, {2, 10}, {8, 10}};
    ASSERT_TRUE(client_.create_send_code().is_ok());

    ProgressRecorder recorder;
    ASSERT_TRUE(client_.send_file(file.string(), recorder.handler()).is_ok());
    ASSERT_TRUE(recorder.wait_for_completion());

    const auto samples = recorder.samples();
    ASSERT_EQ(samples.size(), 3u);
    EXPECT_EQ(samples[0], ProgressEvent::make(4, 10));
    EXPECT_EQ(samples[1], ProgressEvent::make(8, 10));
    EXPECT_EQ(samples[2], ProgressEvent::completed(10));
}

TEST_F(WormholeClientTest, SendFileMissingPathKeepsMailbox) {
    ASSERT_TRUE(client_.create_send_code().is_ok());

    auto sent = client_.send_file((dir_ / "missing.txt").string(), nullptr);
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind(), ErrorKind::FileNotFound);
    EXPECT_EQ(sent.error().detail(), (dir_ / "missing.txt").string());

    EXPECT_EQ(client_.phase(), PhaseKind::MailboxReady);
    EXPECT_EQ(fake_->counters.authenticate.load(), 0);

    // The mailbox is still usable by the next send.
    const auto file = write_file(dir_, "a.txt", "abc");
    EXPECT_TRUE(client_.send_file(file.string(), nullptr).is_ok());
}

TEST_F(WormholeClientTest, SendFileOnlyOncePerCode) {
    const auto file = write_file(dir_, "a.txt", "abc");
    ASSERT_TRUE(client_.create_send_code().is_ok());

    ASSERT_TRUE(client_.send_file(file.string(), nullptr).is_ok());

    auto again = client_.send_file(file.string(), nullptr);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind(), ErrorKind::NoActiveSession);
    EXPECT_EQ(fake_->counters.send.load(), 1);
}

TEST_F(WormholeClientTest, KeyExchangeFailureIsConnectionFailed) {
    const auto file = write_file(dir_, "a.txt", "abc");
    fake_->script.authenticate_failure = Failure{FailureKind::KeyMismatch, "bad code"};
    ASSERT_TRUE(client_.create_send_code().is_ok());

    auto sent = client_.send_file(file.string(), nullptr);
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind(), ErrorKind::ConnectionFailed);
    EXPECT_NE(sent.error().detail().find("key-mismatch"), std::string::npos);
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
}

TEST_F(WormholeClientTest, StreamFailureIsTransferFailed) {
    const auto file = write_file(dir_, "a.txt", "abc");
    fake_->script.send_failure = Failure{FailureKind::Rejected, "peer rejected the offer"};
    ASSERT_TRUE(client_.create_send_code().is_ok());

    auto sent = client_.send_file(file.string(), nullptr);
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().kind(), ErrorKind::TransferFailed);
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
    EXPECT_EQ(metrics_.get_stats().files_sent.load(), 0u);
}

TEST_F(WormholeClientTest, ThrowingProgressHandlerDoesNotAbortTransfer) {
    const auto file = write_file(dir_, "a.txt", "0123456789");
    ASSERT_TRUE(client_.create_send_code().is_ok());

    auto throwing = [](const ProgressEvent&) { throw std::runtime_error("handler failure"); };
    auto sent = client_.send_file(file.string(), throwing);
    ASSERT_TRUE(sent.is_ok()) << sent.error().message();

    // Delivery keeps working for later transfers.
    ASSERT_TRUE(client_.create_send_code().is_ok());
    ProgressRecorder recorder;
    ASSERT_TRUE(client_.send_file(file.string(), recorder.handler()).is_ok());
    EXPECT_TRUE(recorder.wait_for_completion());
}

// ──────────────────────────────────────────────────────────
// connect_receive / accept_transfer / reject_transfer
// ──────────────────────────────────────────────────────────

TEST_F(WormholeClientTest, ConnectReceiveRejectsMalformedCodes) {
    for (const std::string code : {"7-wrong-words", "", "hello", "abc-aardvark", "7"}) {
        auto offer = client_.connect_receive(code);
        ASSERT_TRUE(offer.is_error()) << code;
        EXPECT_EQ(offer.error().kind(), ErrorKind::InvalidCode) << code;
        EXPECT_EQ(offer.error().detail(), code);
    }
    EXPECT_EQ(fake_->counters.network_calls(), 0);
}

TEST_F(WormholeClientTest, ConnectReceiveReturnsOffer) {
    auto offer = client_.connect_receive("7-guitarist-revenge");
    ASSERT_TRUE(offer.is_ok()) << offer.error().message();
    EXPECT_EQ(offer.value().filename, "a.txt");
    EXPECT_EQ(offer.value().filesize, 5u);

    EXPECT_EQ(client_.phase(), PhaseKind::Receiving);
    EXPECT_EQ(fake_->last_relay_hints.size(), 1u);
    EXPECT_EQ(metrics_.get_stats().offers_received.load(), 1u);
}

TEST_F(WormholeClientTest, ConnectReceiveMapsEachStage) {
    fake_->script.bind_failure = Failure{FailureKind::Network, "no such nameplate"};
    auto bound = client_.connect_receive("7-guitarist-revenge");
    ASSERT_TRUE(bound.is_error());
    EXPECT_EQ(bound.error().kind(), ErrorKind::ConnectionFailed);

    fake_->script.bind_failure.reset();
    fake_->script.authenticate_failure = Failure{FailureKind::KeyMismatch, "wrong code"};
    auto authenticated = client_.connect_receive("7-guitarist-revenge");
    ASSERT_TRUE(authenticated.is_error());
    EXPECT_EQ(authenticated.error().kind(), ErrorKind::ConnectionFailed);

    fake_->script.authenticate_failure.reset();
    fake_->script.request_failure = Failure{FailureKind::Protocol, "expected a file offer"};
    auto requested = client_.connect_receive("7-guitarist-revenge");
    ASSERT_TRUE(requested.is_error());
    EXPECT_EQ(requested.error().kind(), ErrorKind::TransferFailed);

    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
}

TEST_F(WormholeClientTest, WithdrawnSenderIsCancelled) {
    fake_->script.withdraw_offer = true;

    auto offer = client_.connect_receive("7-guitarist-revenge");
    ASSERT_TRUE(offer.is_error());
    EXPECT_EQ(offer.error().kind(), ErrorKind::Cancelled);
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
}

TEST_F(WormholeClientTest, UnsafeOfferedNamesAreProtocolErrors) {
    for (const std::string name : {"", ".", "..", "../evil", "dir/file", "dir\\file"}) {
        fake_->script.offered_name = name;
        auto offer = client_.connect_receive("7-guitarist-revenge");
        ASSERT_TRUE(offer.is_error()) << name;
        EXPECT_EQ(offer.error().kind(), ErrorKind::ProtocolError) << name;
        EXPECT_EQ(client_.phase(), PhaseKind::Idle);
    }
}

TEST_F(WormholeClientTest, AcceptTransferWritesDestination) {
    ASSERT_TRUE(client_.connect_receive("7-guitarist-revenge").is_ok());

    ProgressRecorder recorder;
    auto path = client_.accept_transfer(dir_.string(), recorder.handler());
    ASSERT_TRUE(path.is_ok()) << path.error().message();
    EXPECT_EQ(path.value(), (dir_ / "a.txt").string());
    EXPECT_EQ(read_file(dir_ / "a.txt"), "hello");

    ASSERT_TRUE(recorder.wait_for_completion());
    EXPECT_EQ(recorder.samples().back(), ProgressEvent::completed(5));
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
    EXPECT_EQ(metrics_.get_stats().bytes_received.load(), 5u);

    auto again = client_.accept_transfer(dir_.string(), nullptr);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind(), ErrorKind::NoActiveSession);
}

TEST_F(WormholeClientTest, AcceptTransferTruncatesExistingFile) {
    write_file(dir_, "a.txt", "a much longer previous content");
    ASSERT_TRUE(client_.connect_receive("7-guitarist-revenge").is_ok());

    ASSERT_TRUE(client_.accept_transfer(dir_.string(), nullptr).is_ok());
    EXPECT_EQ(read_file(dir_ / "a.txt"), "hello");
}

TEST_F(WormholeClientTest, AcceptIntoUnwritableDirectoryIsIoError) {
    // A regular file cannot hold directory entries, whatever the privileges.
    const auto not_a_dir = write_file(dir_, "plain", "x");
    ASSERT_TRUE(client_.connect_receive("7-guitarist-revenge").is_ok());

    auto path = client_.accept_transfer(not_a_dir.string(), nullptr);
    ASSERT_TRUE(path.is_error());
    EXPECT_EQ(path.error().kind(), ErrorKind::IoError);
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
    EXPECT_EQ(fake_->counters.accept.load(), 0);
}

TEST_F(WormholeClientTest, AcceptStreamFailureLeavesPartialFile) {
    fake_->script.payload = "0123456789";
    fake_->script.accept_failure = Failure{FailureKind::Network, "sender disconnected"};
    ASSERT_TRUE(client_.connect_receive("7-guitarist-revenge").is_ok());

    auto path = client_.accept_transfer(dir_.string(), nullptr);
    ASSERT_TRUE(path.is_error());
    EXPECT_EQ(path.error().kind(), ErrorKind::TransferFailed);
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
    EXPECT_TRUE(fs::exists(dir_ / "a.txt"));
    EXPECT_LT(fs::file_size(dir_ / "a.txt"), 10u);
}

TEST_F(WormholeClientTest, RejectTransferEndsSession) {
    ASSERT_TRUE(client_.connect_receive("7-guitarist-revenge").is_ok());

    ASSERT_TRUE(client_.reject_transfer().is_ok());
    EXPECT_EQ(fake_->counters.reject.load(), 1);
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
    EXPECT_EQ(metrics_.get_stats().offers_rejected.load(), 1u);

    auto accepted = client_.accept_transfer(dir_.string(), nullptr);
    ASSERT_TRUE(accepted.is_error());
    EXPECT_EQ(accepted.error().kind(), ErrorKind::NoActiveSession);
}

TEST_F(WormholeClientTest, RejectDeliveryFailureIsTransferFailed) {
    fake_->script.reject_failure = Failure{FailureKind::Network, "sender already disconnected"};
    ASSERT_TRUE(client_.connect_receive("7-guitarist-revenge").is_ok());

    auto rejected = client_.reject_transfer();
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().kind(), ErrorKind::TransferFailed);
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
}

TEST_F(WormholeClientTest, NewOperationDisplacesPreviousPhase) {
    ASSERT_TRUE(client_.connect_receive("7-guitarist-revenge").is_ok());
    ASSERT_TRUE(client_.create_send_code().is_ok());
    EXPECT_EQ(client_.phase(), PhaseKind::MailboxReady);

    ASSERT_TRUE(client_.connect_receive("7-guitarist-revenge").is_ok());
    EXPECT_EQ(client_.phase(), PhaseKind::Receiving);
}

// ──────────────────────────────────────────────────────────
// cancel
// ──────────────────────────────────────────────────────────

TEST_F(WormholeClientTest, CancelResetsSessionAsynchronously) {
    ASSERT_TRUE(client_.create_send_code().is_ok());

    client_.cancel();

    EXPECT_TRUE(eventually([&]() { return client_.phase() == PhaseKind::Idle; }));
    EXPECT_TRUE(eventually([&]() { return metrics_.get_stats().cancellations.load() == 1u; }));
    EXPECT_EQ(fake_->counters.network_calls(), 1);
}

TEST_F(WormholeClientTest, CancelOnIdleSessionSucceeds) {
    client_.cancel();
    client_.cancel();

    EXPECT_TRUE(eventually([&]() { return metrics_.get_stats().cancellations.load() == 2u; }));
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
}

TEST_F(WormholeClientTest, CancelSurvivesSubscriberThrowingNonException) {
    std::atomic<int> later_subscriber{0};
    bus_.subscribe<wormhole::events::SessionCancelledEvent>(
        [](const wormhole::events::SessionCancelledEvent&) { throw 7; });
    bus_.subscribe<wormhole::events::SessionCancelledEvent>(
        [&](const wormhole::events::SessionCancelledEvent&) { later_subscriber++; });

    ASSERT_TRUE(client_.create_send_code().is_ok());
    client_.cancel();
    client_.cancel();

    EXPECT_TRUE(eventually([&]() { return later_subscriber.load() == 2; }));
    EXPECT_EQ(client_.phase(), PhaseKind::Idle);
}

TEST_F(WormholeClientTest, OperationsAfterCancelUseFreshToken) {
    client_.cancel();
    ASSERT_TRUE(eventually([&]() { return metrics_.get_stats().cancellations.load() == 1u; }));

    const auto file = write_file(dir_, "a.txt", "abc");
    ASSERT_TRUE(client_.create_send_code().is_ok());
    auto sent = client_.send_file(file.string(), nullptr);
    EXPECT_TRUE(sent.is_ok()) << sent.error().message();
}

// ──────────────────────────────────────────────────────────
// Events
// ──────────────────────────────────────────────────────────

TEST_F(WormholeClientTest, FailuresArePublishedWithOperationName) {
    std::vector<wormhole::events::OperationFailedEvent> failures;
    bus_.subscribe<wormhole::events::OperationFailedEvent>(
        [&](const wormhole::events::OperationFailedEvent& e) { failures.push_back(e); });

    ASSERT_TRUE(client_.connect_receive("7-wrong-words").is_error());
    ASSERT_TRUE(client_.reject_transfer().is_error());

    ASSERT_EQ(failures.size(), 2u);
    EXPECT_EQ(failures[0].operation, "connect_receive");
    EXPECT_EQ(failures[0].error_kind, "InvalidCode");
    EXPECT_EQ(failures[0].message, "Invalid code: 7-wrong-words");
    EXPECT_EQ(failures[1].operation, "reject_transfer");
    EXPECT_EQ(failures[1].error_kind, "NoActiveSession");
}
