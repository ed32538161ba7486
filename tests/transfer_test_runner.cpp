#include "avatar_cache.hpp"
#include "outbound_sender.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "transfer_coordinator.hpp"
#include "transfer_history.hpp"
#include "transfer_listener.hpp"
#include "transfer_queue.hpp"
#include "user_profile.hpp"
#include "utils.hpp"
#include "woxxy_engine.hpp"

#include <asio.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

using woxxy::test::TestCase;
using woxxy::test::TestContext;

namespace {

using namespace std::chrono_literals;
using asio::ip::tcp;

std::string random_payload(std::size_t size) {
  std::mt19937 rng(1234);
  std::string out(size, '\0');
  for(auto& c : out) c = static_cast<char>(rng() & 0xFF);
  return out;
}

// Receiver and sender sharing one io_context on a background thread.
struct Loopback {
  std::filesystem::path dir;
  asio::io_context io;
  asio::executor_work_guard<asio::io_context::executor_type> work = asio::make_work_guard(io);
  std::thread io_thread;
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("transfer");
  std::shared_ptr<UserProfile> receiver_profile;
  std::shared_ptr<UserProfile> sender_profile;
  std::shared_ptr<TransferHistory> history = std::make_shared<TransferHistory>();
  std::shared_ptr<AvatarCache> avatars;
  std::shared_ptr<TransferCoordinator> coordinator;
  std::unique_ptr<TransferListener> listener;
  std::shared_ptr<OutboundSender> sender;

  Loopback(TestContext& ctx, const std::string& name) {
    dir = woxxy::test::scratch_dir(name);
    ctx.logs.attach(logger);

    ProfileSnapshot receiver;
    receiver.username = "receiver";
    receiver.download_directory = dir / "downloads";
    receiver_profile = std::make_shared<UserProfile>(receiver);

    ProfileSnapshot sending;
    sending.username = "sender";
    sender_profile = std::make_shared<UserProfile>(sending);

    avatars = std::make_shared<AvatarCache>(dir / "avatars", logger);
    coordinator = std::make_shared<TransferCoordinator>(receiver_profile, history, avatars,
                                                        dir / "staging", logger);
    listener = std::make_unique<TransferListener>(io, coordinator, 16 * 1024, logger);
    listener->start("127.0.0.1", 0);

    OutboundSender::Options options;
    options.connect_timeout = 2000ms;
    options.ready_timeout = 1000ms;
    options.chunk_size = 16 * 1024;
    sender = std::make_shared<OutboundSender>(io, sender_profile, options, logger);
    sender->set_local_address("127.0.0.1");

    io_thread = std::thread([this]{ io.run(); });
  }

  ~Loopback() {
    asio::post(io, [this]{
      listener->stop();
      sender->cancel_all();
    });
    work.reset();
    // Let the posted shutdown run before the loop is stopped.
    std::this_thread::sleep_for(50ms);
    io.stop();
    if(io_thread.joinable()) io_thread.join();
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  PeerIdentity receiver_identity() const {
    return PeerIdentity{"receiver", "127.0.0.1", listener->port()};
  }

  // Blocks until the completion callback runs.
  std::optional<TransferOutcome> send_and_wait(const std::filesystem::path& path,
                                               std::chrono::milliseconds timeout = 5000ms) {
    SendRequest request;
    request.transfer_id = make_transfer_id(path.filename().string());
    request.file_path = path;
    request.destination = receiver_identity();
    auto result = std::make_shared<std::optional<TransferOutcome>>();
    auto m = std::make_shared<std::mutex>();
    sender->send(request, nullptr, [result, m](const TransferOutcome& outcome){
      std::lock_guard lg(*m);
      *result = outcome;
    });
    woxxy::test::wait_for_condition([&]{
      std::lock_guard lg(*m);
      return result->has_value();
    }, timeout);
    std::lock_guard lg(*m);
    return *result;
  }
};

// Speaks the wire protocol by hand.
class RawClient {
public:
  explicit RawClient(uint16_t port) : socket_(io_) {
    socket_.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
  }

  void send_header(const TransferMetadata& md) {
    auto header = encode_frame_header(md);
    asio::write(socket_, asio::buffer(header));
  }

  void send_raw(const std::string& bytes) {
    asio::write(socket_, asio::buffer(bytes));
  }

  bool read_ready() {
    std::array<unsigned char, 3> buf{};
    std::error_code ec;
    asio::read(socket_, asio::buffer(buf), ec);
    return !ec && std::equal(buf.begin(), buf.end(), kReadyToken.begin());
  }

  void half_close() {
    std::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
  }

  // True once the receiver has closed its side.
  bool wait_closed() {
    std::array<char, 64> sink{};
    std::error_code ec;
    while(!ec) socket_.read_some(asio::buffer(sink), ec);
    return ec == asio::error::eof || ec == asio::error::connection_reset;
  }

  void close() {
    std::error_code ec;
    socket_.close(ec);
  }

private:
  asio::io_context io_;
  tcp::socket socket_;
};

TransferMetadata raw_metadata(const std::string& name, uint64_t size, std::string checksum) {
  TransferMetadata md;
  md.file_name = name;
  md.size_bytes = size;
  md.sender_name = "raw";
  md.sender_address = "127.0.0.1";
  md.expected_checksum = std::move(checksum);
  md.transfer_id = make_transfer_id(name);
  return md;
}

bool test_file_arrives_intact(TestContext& ctx) {
  Loopback lb(ctx, "wire_intact");
  auto payload = random_payload(300 * 1024 + 17);
  auto source = lb.dir / "outbox" / "photo.raw";
  woxxy::test::write_file(source, payload);

  auto outcome = lb.send_and_wait(source);
  if(!outcome || !outcome->ok()) return false;
  bool recorded = woxxy::test::wait_for_condition([&]{ return lb.history->size() == 1; }, 2s);
  auto received = woxxy::test::read_file(lb.dir / "downloads" / "photo.raw");
  auto entries = lb.history->entries();
  return recorded && received == payload && entries[0].sender == "sender" &&
         entries[0].size == payload.size() && lb.listener->stats().completed == 1 &&
         ctx.logs.contains("Sent photo.raw");
}

bool test_back_to_back_sends_through_queue(TestContext& ctx) {
  Loopback lb(ctx, "wire_queue");
  auto queue = std::make_shared<TransferQueue>(lb.receiver_identity(), lb.sender, lb.logger);
  std::vector<std::string> ids;
  for(int i = 0; i < 3; ++i) {
    auto path = lb.dir / "outbox" / ("part" + std::to_string(i) + ".bin");
    woxxy::test::write_file(path, random_payload(40 * 1024 + i));
    ids.push_back(queue->enqueue(path));
  }
  bool done = woxxy::test::wait_for_condition([&]{
    for(const auto& item : queue->items()) {
      if(item.status == QueueItemStatus::Pending || item.status == QueueItemStatus::Sending) return false;
    }
    return true;
  }, 10s);
  if(!done) return false;
  for(const auto& item : queue->items()) {
    if(item.status != QueueItemStatus::Completed) return false;
  }
  return woxxy::test::wait_for_condition([&]{ return lb.history->size() == 3; }, 2s) &&
         woxxy::test::count_files(lb.dir / "downloads") == 3;
}

bool test_send_without_checksum(TestContext& ctx) {
  Loopback lb(ctx, "wire_nochecksum");
  auto snap = lb.sender_profile->current();
  snap.checksum_enabled = false;
  lb.sender_profile->update(snap);
  auto source = lb.dir / "outbox" / "plain.txt";
  woxxy::test::write_file(source, "no digest for this one");
  auto outcome = lb.send_and_wait(source);
  return outcome && outcome->ok() &&
         woxxy::test::wait_for_condition([&]{ return lb.history->size() == 1; }, 2s) &&
         ctx.logs.contains("Skipping verification of plain.txt");
}

bool test_empty_file(TestContext& ctx) {
  Loopback lb(ctx, "wire_empty");
  auto source = lb.dir / "outbox" / "empty.txt";
  woxxy::test::write_file(source, "");
  auto outcome = lb.send_and_wait(source);
  return outcome && outcome->ok() &&
         woxxy::test::wait_for_condition([&]{ return lb.history->size() == 1; }, 2s) &&
         std::filesystem::file_size(lb.dir / "downloads" / "empty.txt") == 0;
}

bool test_missing_file_fails_fast(TestContext& ctx) {
  Loopback lb(ctx, "wire_missing");
  auto outcome = lb.send_and_wait(lb.dir / "does-not-exist.bin", 2000ms);
  return outcome && outcome->error == TransferError::Filesystem && lb.sender->in_flight() == 0;
}

bool test_refused_connection_is_network_error(TestContext& ctx) {
  Loopback lb(ctx, "wire_refused");
  auto source = lb.dir / "outbox" / "x.txt";
  woxxy::test::write_file(source, "x");
  uint16_t port = lb.listener->port();
  std::promise<void> stopped;
  auto stopped_future = stopped.get_future();
  asio::post(lb.io, [&]{ lb.listener->stop(); stopped.set_value(); });
  stopped_future.wait();

  SendRequest request;
  request.transfer_id = "refused";
  request.file_path = source;
  request.destination = PeerIdentity{"gone", "127.0.0.1", port};
  std::promise<TransferOutcome> result;
  auto future = result.get_future();
  lb.sender->send(request, nullptr, [&](const TransferOutcome& o){ result.set_value(o); });
  if(future.wait_for(5s) != std::future_status::ready) return false;
  return future.get().error == TransferError::Network;
}

bool test_cancel_reports_cancelled(TestContext& ctx) {
  Loopback lb(ctx, "wire_cancel");
  auto source = lb.dir / "outbox" / "big.bin";
  woxxy::test::write_file(source, random_payload(4 * 1024 * 1024));

  SendRequest request;
  request.transfer_id = "cancel-me";
  request.file_path = source;
  request.destination = lb.receiver_identity();
  std::promise<TransferOutcome> result;
  auto future = result.get_future();
  lb.sender->send(request, nullptr, [&](const TransferOutcome& o){ result.set_value(o); });
  bool cancelled = lb.sender->cancel("cancel-me");
  if(future.wait_for(5s) != std::future_status::ready) return false;
  auto outcome = future.get();
  return cancelled && outcome.error == TransferError::Cancelled &&
         !lb.sender->cancel("cancel-me") && lb.history->size() == 0;
}

bool test_cancel_mid_stream_discards_partial(TestContext& ctx) {
  Loopback lb(ctx, "wire_cancel_mid_stream");
  auto source = lb.dir / "outbox" / "movie.bin";
  woxxy::test::write_file(source, random_payload(8 * 1024 * 1024));

  SendRequest request;
  request.transfer_id = "stop-halfway";
  request.file_path = source;
  request.destination = lb.receiver_identity();
  std::atomic<uint64_t> last_sent{0};
  std::atomic<bool> cancel_issued{false};
  auto sender = lb.sender;
  auto on_progress = [&, sender](uint64_t, uint64_t sent){
    last_sent = sent;
    if(sent > 0 && !cancel_issued.exchange(true)) sender->cancel("stop-halfway");
  };
  std::promise<TransferOutcome> result;
  auto future = result.get_future();
  lb.sender->send(request, on_progress, [&](const TransferOutcome& o){ result.set_value(o); });
  if(future.wait_for(5s) != std::future_status::ready) return false;
  auto outcome = future.get();

  bool aborted = woxxy::test::wait_for_condition([&]{ return lb.listener->stats().aborted == 1; }, 2s);
  return cancel_issued && outcome.error == TransferError::Cancelled &&
         last_sent > 0 && last_sent < 8 * 1024 * 1024 && aborted &&
         lb.coordinator->active_count() == 0 && lb.history->size() == 0 &&
         woxxy::test::count_files(lb.dir / "downloads") == 0 &&
         ctx.logs.contains("cancelled after");
}

bool test_unwritable_download_dir_fails_sender(TestContext& ctx) {
  Loopback lb(ctx, "wire_unwritable");
  auto blocker = lb.dir / "blocker";
  woxxy::test::write_file(blocker, "a file where a directory should be");
  auto snap = lb.receiver_profile->current();
  snap.download_directory = blocker / "inbox";
  lb.receiver_profile->update(snap);

  auto source = lb.dir / "outbox" / "report.pdf";
  woxxy::test::write_file(source, random_payload(64 * 1024));
  auto outcome = lb.send_and_wait(source);
  bool failed = woxxy::test::wait_for_condition([&]{ return lb.listener->stats().failed == 1; }, 2s);
  return outcome && !outcome->ok() && outcome->error == TransferError::Network && failed &&
         lb.coordinator->active_count() == 0 && lb.history->size() == 0 &&
         lb.listener->stats().completed == 0 && ctx.logs.contains("Cannot receive report.pdf");
}

bool test_overlapping_receive_fails_sender(TestContext& ctx) {
  Loopback lb(ctx, "wire_overlap");
  auto held = raw_metadata("held.bin", 1024, kChecksumSkipped);
  if(!lb.coordinator->begin("127.0.0.1", held).ok()) return false;

  auto source = lb.dir / "outbox" / "second.bin";
  woxxy::test::write_file(source, random_payload(32 * 1024));
  auto outcome = lb.send_and_wait(source);
  bool rejected = outcome && outcome->error == TransferError::Network &&
                  ctx.logs.contains("already active");
  bool untouched = lb.coordinator->is_active("127.0.0.1") &&
                   lb.coordinator->received_bytes("127.0.0.1") == uint64_t{0};
  lb.coordinator->abort("127.0.0.1", "test finished");
  return rejected && untouched && lb.history->size() == 0 &&
         woxxy::test::count_files(lb.dir / "downloads") == 0;
}

bool test_reset_after_body_is_network_error(TestContext& ctx) {
  Loopback lb(ctx, "wire_reset_after_body");
  auto source = lb.dir / "outbox" / "doomed.bin";
  woxxy::test::write_file(source, random_payload(48 * 1024));

  // Accepts the whole payload, then resets instead of closing cleanly.
  asio::io_context peer_io;
  tcp::acceptor acceptor(peer_io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  uint16_t port = acceptor.local_endpoint().port();
  std::thread peer([&]{
    tcp::socket socket(peer_io);
    std::error_code ec;
    acceptor.accept(socket, ec);
    if(ec) return;
    std::array<char, 4096> sink{};
    socket.read_some(asio::buffer(sink), ec);
    asio::write(socket, asio::buffer(kReadyToken), ec);
    while(!ec) socket.read_some(asio::buffer(sink), ec);
    socket.set_option(asio::socket_base::linger(true, 0), ec);
    socket.close(ec);
  });

  SendRequest request;
  request.transfer_id = "reset-after-body";
  request.file_path = source;
  request.destination = PeerIdentity{"resetter", "127.0.0.1", port};
  std::promise<TransferOutcome> result;
  auto future = result.get_future();
  lb.sender->send(request, nullptr, [&](const TransferOutcome& o){ result.set_value(o); });
  bool settled = future.wait_for(5s) == std::future_status::ready;
  peer.join();
  if(!settled) return false;
  auto outcome = future.get();
  return outcome.error == TransferError::Network &&
         outcome.message.find("drain") != std::string::npos;
}

bool test_duplicate_transfer_id_rejected(TestContext& ctx) {
  Loopback lb(ctx, "wire_duplicate");
  auto source = lb.dir / "outbox" / "dup.bin";
  woxxy::test::write_file(source, random_payload(2 * 1024 * 1024));

  SendRequest request;
  request.transfer_id = "same-id";
  request.file_path = source;
  request.destination = lb.receiver_identity();
  std::promise<TransferOutcome> first;
  std::promise<TransferOutcome> second;
  auto first_future = first.get_future();
  auto second_future = second.get_future();
  lb.sender->send(request, nullptr, [&](const TransferOutcome& o){ first.set_value(o); });
  lb.sender->send(request, nullptr, [&](const TransferOutcome& o){ second.set_value(o); });
  if(second_future.wait_for(5s) != std::future_status::ready) return false;
  bool rejected = second_future.get().error == TransferError::ProtocolFormat;
  if(first_future.wait_for(10s) != std::future_status::ready) return false;
  return rejected && first_future.get().ok();
}

bool test_close_before_data_aborts(TestContext& ctx) {
  Loopback lb(ctx, "wire_early_close");
  RawClient client(lb.listener->port());
  client.send_header(raw_metadata("never.bin", 4096, kChecksumSkipped));
  if(!client.read_ready()) return false;
  client.close();
  bool aborted = woxxy::test::wait_for_condition([&]{ return lb.listener->stats().aborted == 1; }, 2s);
  return aborted && lb.coordinator->active_count() == 0 &&
         woxxy::test::count_files(lb.dir / "downloads") == 0;
}

bool test_short_body_aborts(TestContext& ctx) {
  Loopback lb(ctx, "wire_short_body");
  RawClient client(lb.listener->port());
  std::string full(1024, '\0');
  client.send_header(raw_metadata("half.bin", full.size(), md5_hex(full)));
  if(!client.read_ready()) return false;
  client.send_raw(full.substr(0, 512));
  client.half_close();
  bool closed = client.wait_closed();
  bool aborted = woxxy::test::wait_for_condition([&]{ return lb.listener->stats().aborted == 1; }, 2s);
  return closed && aborted && woxxy::test::count_files(lb.dir / "downloads") == 0;
}

bool test_surplus_bytes_ignored(TestContext& ctx) {
  Loopback lb(ctx, "wire_surplus");
  RawClient client(lb.listener->port());
  std::string body = "exactly sixteen!";
  client.send_header(raw_metadata("exact.txt", body.size(), md5_hex(body)));
  if(!client.read_ready()) return false;
  client.send_raw(body + "and then some extra bytes");
  client.half_close();
  client.wait_closed();
  bool recorded = woxxy::test::wait_for_condition([&]{ return lb.history->size() == 1; }, 2s);
  return recorded && woxxy::test::read_file(lb.dir / "downloads" / "exact.txt") == body &&
         ctx.logs.contains("ignoring the surplus");
}

bool test_bad_length_prefix_dropped(TestContext& ctx) {
  Loopback lb(ctx, "wire_bad_length");
  {
    RawClient zero(lb.listener->port());
    zero.send_raw(std::string(4, '\0'));
    zero.wait_closed();
  }
  {
    RawClient huge(lb.listener->port());
    huge.send_raw(std::string("\x7F\xFF\xFF\xFF", 4));
    huge.wait_closed();
  }
  {
    RawClient garbage(lb.listener->port());
    std::string doc = "not json at all";
    std::string prefix = {0, 0, 0, static_cast<char>(doc.size())};
    garbage.send_raw(prefix + doc);
    garbage.wait_closed();
  }
  bool failed = woxxy::test::wait_for_condition([&]{ return lb.listener->stats().failed == 3; }, 2s);
  return failed && lb.coordinator->active_count() == 0 && lb.listener->stats().accepted == 3;
}

bool test_avatar_push_lands_in_cache(TestContext& ctx) {
  Loopback lb(ctx, "wire_avatar");
  auto avatar = lb.dir / "me.png";
  woxxy::test::write_file(avatar, woxxy::test::tiny_png());
  auto snap = lb.sender_profile->current();
  snap.avatar_path = avatar;
  lb.sender_profile->update(snap);

  std::promise<TransferOutcome> result;
  auto future = result.get_future();
  bool started = lb.sender->send_avatar(lb.receiver_identity(),
                                        [&](const TransferOutcome& o){ result.set_value(o); });
  if(!started || future.wait_for(5s) != std::future_status::ready) return false;
  bool cached = woxxy::test::wait_for_condition([&]{ return lb.avatars->has("127.0.0.1"); }, 2s);
  return future.get().ok() && cached && lb.history->size() == 0 &&
         woxxy::test::count_files(lb.dir / "downloads") == 0;
}

bool test_avatar_requires_usable_file(TestContext& ctx) {
  Loopback lb(ctx, "wire_avatar_missing");
  bool none = !lb.sender->send_avatar(lb.receiver_identity());
  auto snap = lb.sender_profile->current();
  snap.avatar_path = lb.dir / "nope.png";
  lb.sender_profile->update(snap);
  bool missing = !lb.sender->send_avatar(lb.receiver_identity());
  woxxy::test::write_file(lb.dir / "empty.png", "");
  snap.avatar_path = lb.dir / "empty.png";
  lb.sender_profile->update(snap);
  bool empty = !lb.sender->send_avatar(lb.receiver_identity());
  return none && missing && empty && lb.sender->in_flight() == 0;
}

bool test_engine_lifecycle(TestContext& ctx) {
  auto dir = woxxy::test::scratch_dir("engine_lifecycle");
  auto settings = std::make_shared<SettingsManager>();
  std::string error;
  bool configured = settings->set_from_string("local_ip", "127.0.0.1", error) &&
                    settings->set_from_string("transfer_port", "0", error) &&
                    settings->set_from_string("download_dir", (dir / "downloads").string(), error) &&
                    settings->set_from_string("username", "engine-test", error);
  if(!configured) return false;

  WoxxyEngine::Options options;
  options.start_cli_thread = false;
  options.enable_discovery = false;
  WoxxyEngine engine(settings, options);
  ctx.logs.attach(engine, "engine");
  engine.start();
  engine.start_background();

  bool listening = engine.transfer_port() != 0 && engine.local_address() == "127.0.0.1";
  bool renamed = engine.apply_setting("username", "renamed", error) &&
                 engine.identity().display_name == "renamed" &&
                 engine.profile()->username() == "renamed";
  bool bad_value = !engine.apply_setting("checksum_enabled", "maybe", error);
  std::string unknown_error;
  bool unknown_peer = engine.send_files("nobody", {dir / "x"}, unknown_error).empty() && !unknown_error.empty();
  engine.execute_command("whoami");
  auto stats = engine.stats();

  engine.stop();
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return listening && renamed && bad_value && unknown_peer && stats.known_peers == 0 &&
         ctx.logs.contains("ready at 127.0.0.1");
}

bool test_engine_stop_discards_unfinished_receive(TestContext& ctx) {
  auto dir = woxxy::test::scratch_dir("engine_stop_receive");
  auto settings = std::make_shared<SettingsManager>();
  std::string error;
  bool configured = settings->set_from_string("local_ip", "127.0.0.1", error) &&
                    settings->set_from_string("transfer_port", "0", error) &&
                    settings->set_from_string("download_dir", (dir / "downloads").string(), error);
  if(!configured) return false;

  WoxxyEngine::Options options;
  options.start_cli_thread = false;
  options.enable_discovery = false;
  WoxxyEngine engine(settings, options);
  ctx.logs.attach(engine, "engine");
  engine.start();
  engine.start_background();

  RawClient client(engine.transfer_port());
  std::string full(256 * 1024, 'z');
  client.send_header(raw_metadata("interrupted.bin", full.size(), md5_hex(full)));
  if(!client.read_ready()) return false;
  client.send_raw(full.substr(0, 1000));
  bool streaming = woxxy::test::wait_for_condition([&]{ return engine.stats().active_receives == 1; }, 2s);
  bool on_disk = woxxy::test::count_files(dir / "downloads") == 1;

  engine.stop();
  bool discarded = woxxy::test::count_files(dir / "downloads") == 0 &&
                   engine.stats().active_receives == 0 &&
                   ctx.logs.contains("Discarded 1 unfinished receive");
  client.close();
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return streaming && on_disk && discarded;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"file_arrives_intact", test_file_arrives_intact},
    {"back_to_back_sends_through_queue", test_back_to_back_sends_through_queue},
    {"send_without_checksum", test_send_without_checksum},
    {"empty_file", test_empty_file},
    {"missing_file_fails_fast", test_missing_file_fails_fast},
    {"refused_connection_is_network_error", test_refused_connection_is_network_error},
    {"cancel_reports_cancelled", test_cancel_reports_cancelled},
    {"cancel_mid_stream_discards_partial", test_cancel_mid_stream_discards_partial},
    {"unwritable_download_dir_fails_sender", test_unwritable_download_dir_fails_sender},
    {"overlapping_receive_fails_sender", test_overlapping_receive_fails_sender},
    {"reset_after_body_is_network_error", test_reset_after_body_is_network_error},
    {"duplicate_transfer_id_rejected", test_duplicate_transfer_id_rejected},
    {"close_before_data_aborts", test_close_before_data_aborts},
    {"short_body_aborts", test_short_body_aborts},
    {"surplus_bytes_ignored", test_surplus_bytes_ignored},
    {"bad_length_prefix_dropped", test_bad_length_prefix_dropped},
    {"avatar_push_lands_in_cache", test_avatar_push_lands_in_cache},
    {"avatar_requires_usable_file", test_avatar_requires_usable_file},
    {"engine_lifecycle", test_engine_lifecycle},
    {"engine_stop_discards_unfinished_receive", test_engine_stop_discards_unfinished_receive}
  };
  return woxxy::test::run_tests("transfer", tests, argc, argv);
}
