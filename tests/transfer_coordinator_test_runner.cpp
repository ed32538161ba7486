#include "avatar_cache.hpp"
#include "peer_registry.hpp"
#include "test_runner_utils.hpp"
#include "transfer_coordinator.hpp"
#include "transfer_history.hpp"
#include "user_profile.hpp"
#include "utils.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using woxxy::test::TestCase;
using woxxy::test::TestContext;

namespace {

using namespace std::chrono_literals;

struct Fixture {
  std::filesystem::path dir;
  std::filesystem::path downloads;
  std::filesystem::path staging;
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("coordinator");
  std::shared_ptr<UserProfile> profile;
  std::shared_ptr<TransferHistory> history = std::make_shared<TransferHistory>();
  std::shared_ptr<AvatarCache> avatars;
  std::shared_ptr<TransferCoordinator> coordinator;

  Fixture(TestContext& ctx, const std::string& name) {
    dir = woxxy::test::scratch_dir(name);
    downloads = dir / "downloads";
    staging = dir / "staging";
    ctx.logs.attach(logger);
    ProfileSnapshot snap;
    snap.username = "receiver";
    snap.download_directory = downloads;
    profile = std::make_shared<UserProfile>(snap);
    avatars = std::make_shared<AvatarCache>(dir / "avatars", logger);
    coordinator = std::make_shared<TransferCoordinator>(profile, history, avatars, staging, logger);
  }

  ~Fixture() {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }
};

TransferMetadata metadata_for(const std::string& name, const std::string& payload, std::string checksum) {
  TransferMetadata md;
  md.file_name = name;
  md.size_bytes = payload.size();
  md.sender_name = "sender";
  md.sender_address = "10.0.0.2";
  md.expected_checksum = std::move(checksum);
  md.transfer_id = make_transfer_id(name);
  return md;
}

bool test_full_file_verifies(TestContext& ctx) {
  Fixture f(ctx, "coord_full");
  std::string payload(1024, '\0');
  std::vector<ReceivedFile> delivered;
  f.coordinator->add_file_received_listener([&](const ReceivedFile& r){ delivered.push_back(r); });

  auto md = metadata_for("zeros.bin", payload, md5_hex(payload));
  if(!f.coordinator->begin("10.0.0.2", md).ok()) return false;
  if(!f.coordinator->write("10.0.0.2", payload.data(), 512)) return false;
  if(!f.coordinator->write("10.0.0.2", payload.data() + 512, 512)) return false;
  if(f.coordinator->received_bytes("10.0.0.2").value_or(0) != 1024) return false;

  auto outcome = f.coordinator->finalize("10.0.0.2");
  auto target = f.downloads / "zeros.bin";
  return outcome.ok() && !f.coordinator->is_active("10.0.0.2") &&
         std::filesystem::file_size(target) == 1024 &&
         f.history->size() == 1 && delivered.size() == 1 &&
         delivered[0].path == target && delivered[0].sender == "sender" && delivered[0].size == 1024;
}

bool test_early_close_deletes_partial(TestContext& ctx) {
  Fixture f(ctx, "coord_partial");
  std::string payload(1024, 'x');
  auto md = metadata_for("partial.bin", payload, md5_hex(payload));
  f.coordinator->begin("10.0.0.2", md);
  f.coordinator->write("10.0.0.2", payload.data(), 512);

  auto outcome = f.coordinator->abort("10.0.0.2", "connection closed");
  return outcome.error == TransferError::Network &&
         !std::filesystem::exists(f.downloads / "partial.bin") &&
         f.coordinator->active_count() == 0 && f.history->size() == 0;
}

bool test_sender_checksum_failure_skips_verification(TestContext& ctx) {
  Fixture f(ctx, "coord_sentinel");
  std::string payload = "hello";
  auto md = metadata_for("hello.txt", payload, kChecksumSenderFailed);
  f.coordinator->begin("10.0.0.2", md);
  f.coordinator->write("10.0.0.2", payload.data(), payload.size());
  auto outcome = f.coordinator->finalize("10.0.0.2");
  return outcome.ok() && woxxy::test::read_file(f.downloads / "hello.txt") == payload;
}

bool test_checksum_mismatch_deletes(TestContext& ctx) {
  Fixture f(ctx, "coord_mismatch");
  std::string payload = "actual bytes";
  auto md = metadata_for("bad.txt", payload, md5_hex("other bytes"));
  f.coordinator->begin("10.0.0.2", md);
  f.coordinator->write("10.0.0.2", payload.data(), payload.size());
  auto outcome = f.coordinator->finalize("10.0.0.2");
  return outcome.error == TransferError::ChecksumMismatch &&
         !std::filesystem::exists(f.downloads / "bad.txt") && f.history->size() == 0;
}

bool test_same_name_twice_gets_two_files(TestContext& ctx) {
  Fixture f(ctx, "coord_collision");
  std::string payload = "same";
  for(int i = 0; i < 2; ++i) {
    auto md = metadata_for("note.txt", payload, kChecksumSkipped);
    if(!f.coordinator->begin("10.0.0.2", md).ok()) return false;
    f.coordinator->write("10.0.0.2", payload.data(), payload.size());
    if(!f.coordinator->finalize("10.0.0.2").ok()) return false;
  }
  return std::filesystem::exists(f.downloads / "note.txt") &&
         std::filesystem::exists(f.downloads / "note_1.txt") &&
         woxxy::test::count_files(f.downloads) == 2;
}

bool test_overlapping_begin_rejected(TestContext& ctx) {
  Fixture f(ctx, "coord_overlap");
  auto first = metadata_for("a.txt", "aaaa", kChecksumSkipped);
  auto second = metadata_for("b.txt", "bbbb", kChecksumSkipped);
  bool began = f.coordinator->begin("10.0.0.2", first).ok();
  auto rejected = f.coordinator->begin("10.0.0.2", second);
  bool other_peer = f.coordinator->begin("10.0.0.3", second).ok();
  return began && rejected.error == TransferError::ProtocolFormat && other_peer &&
         f.coordinator->active_count() == 2 &&
         !std::filesystem::exists(f.downloads / "b_1.txt");
}

bool test_write_without_begin(TestContext& ctx) {
  Fixture f(ctx, "coord_stray");
  const char data[] = "x";
  bool refused = !f.coordinator->write("10.0.0.9", data, 1);
  bool no_finalize = f.coordinator->finalize("10.0.0.9").error == TransferError::ProtocolFormat;
  bool no_abort = f.coordinator->abort("10.0.0.9", "gone").error == TransferError::ProtocolFormat;
  return refused && no_finalize && no_abort;
}

bool test_unwritable_directory(TestContext& ctx) {
  Fixture f(ctx, "coord_unwritable");
  woxxy::test::write_file(f.dir / "blocker", "file, not a directory");
  ProfileSnapshot snap = f.profile->current();
  snap.download_directory = f.dir / "blocker" / "inner";
  f.profile->update(snap);
  auto outcome = f.coordinator->begin("10.0.0.2", metadata_for("x.txt", "x", kChecksumSkipped));
  return outcome.error == TransferError::Filesystem && f.coordinator->active_count() == 0;
}

bool test_abort_keeps_complete_verified_file(TestContext& ctx) {
  Fixture f(ctx, "coord_abort_keep");
  std::string payload = "complete content";
  auto md = metadata_for("kept.txt", payload, md5_hex(payload));
  f.coordinator->begin("10.0.0.2", md);
  f.coordinator->write("10.0.0.2", payload.data(), payload.size());
  auto outcome = f.coordinator->abort("10.0.0.2", "reset by peer");
  return !outcome.ok() && woxxy::test::read_file(f.downloads / "kept.txt") == payload &&
         f.history->size() == 0;
}

bool test_abort_all_discards_unfinished(TestContext& ctx) {
  Fixture f(ctx, "coord_abort_all");
  std::string payload(1024, '\0');
  std::string kept = "already whole";
  f.coordinator->begin("10.0.0.2", metadata_for("a.bin", payload, md5_hex(payload)));
  f.coordinator->write("10.0.0.2", payload.data(), 512);
  f.coordinator->begin("10.0.0.3", metadata_for("b.txt", kept, md5_hex(kept)));
  f.coordinator->write("10.0.0.3", kept.data(), kept.size());

  auto aborted = f.coordinator->abort_all("engine stopped");
  return aborted == 2 && f.coordinator->active_count() == 0 &&
         !std::filesystem::exists(f.downloads / "a.bin") &&
         woxxy::test::read_file(f.downloads / "b.txt") == kept &&
         f.coordinator->abort_all("again") == 0 && f.history->size() == 0;
}

bool test_destruction_deletes_partial(TestContext& ctx) {
  Fixture f(ctx, "coord_destroyed");
  std::string payload(1024, '\0');
  f.coordinator->begin("10.0.0.2", metadata_for("a.bin", payload, md5_hex(payload)));
  f.coordinator->write("10.0.0.2", payload.data(), 512);
  bool present = std::filesystem::exists(f.downloads / "a.bin");
  f.coordinator.reset();
  return present && woxxy::test::count_files(f.downloads) == 0 &&
         ctx.logs.contains("shutting down");
}

bool test_avatar_payload_is_cached(TestContext& ctx) {
  Fixture f(ctx, "coord_avatar");
  auto registry = std::make_shared<PeerRegistry>(f.avatars, 30s, f.logger);
  registry->set_avatar_needed_listener([](const PeerIdentity&){});
  registry->add_or_refresh(PeerIdentity{"bob", "10.0.0.2", 8090});
  f.coordinator->set_registry(registry);
  std::size_t snapshots = 0;
  registry->subscribe([&](const PeerSnapshot&){ snapshots++; });

  std::string png = woxxy::test::tiny_png();
  auto md = metadata_for("me.png", png, md5_hex(png));
  md.kind = PayloadKind::Capability;
  f.coordinator->begin("10.0.0.2", md);
  f.coordinator->write("10.0.0.2", png.data(), png.size());
  auto outcome = f.coordinator->finalize("10.0.0.2");

  auto cached = f.avatars->get("10.0.0.2");
  return outcome.ok() && cached && cached->size() == png.size() &&
         woxxy::test::count_files(f.staging) == 0 &&
         woxxy::test::count_files(f.downloads) == 0 &&
         !registry->avatar_fetch_pending("10.0.0.2") &&
         snapshots == 2 && f.history->size() == 0;
}

bool test_avatar_payload_must_be_image(TestContext& ctx) {
  Fixture f(ctx, "coord_avatar_bad");
  std::string junk = "this is not a picture";
  auto md = metadata_for("me.png", junk, kChecksumSkipped);
  md.kind = PayloadKind::Capability;
  f.coordinator->begin("10.0.0.2", md);
  f.coordinator->write("10.0.0.2", junk.data(), junk.size());
  auto outcome = f.coordinator->finalize("10.0.0.2");
  return outcome.error == TransferError::ProtocolFormat && !f.avatars->has("10.0.0.2") &&
         woxxy::test::count_files(f.staging) == 0;
}

bool test_listener_exception_is_contained(TestContext& ctx) {
  Fixture f(ctx, "coord_listener_throw");
  f.coordinator->add_file_received_listener([](const ReceivedFile&){
    throw std::runtime_error("ui went away");
  });
  bool second_called = false;
  auto handle = f.coordinator->add_file_received_listener([&](const ReceivedFile&){ second_called = true; });
  std::string payload = "abc";
  f.coordinator->begin("10.0.0.2", metadata_for("abc.txt", payload, kChecksumSkipped));
  f.coordinator->write("10.0.0.2", payload.data(), payload.size());
  bool ok = f.coordinator->finalize("10.0.0.2").ok();
  f.coordinator->remove_file_received_listener(handle);
  return ok && second_called && ctx.logs.contains("ui went away");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"full_file_verifies", test_full_file_verifies},
    {"early_close_deletes_partial", test_early_close_deletes_partial},
    {"sender_checksum_failure_skips_verification", test_sender_checksum_failure_skips_verification},
    {"checksum_mismatch_deletes", test_checksum_mismatch_deletes},
    {"same_name_twice_gets_two_files", test_same_name_twice_gets_two_files},
    {"overlapping_begin_rejected", test_overlapping_begin_rejected},
    {"write_without_begin", test_write_without_begin},
    {"unwritable_directory", test_unwritable_directory},
    {"abort_keeps_complete_verified_file", test_abort_keeps_complete_verified_file},
    {"abort_all_discards_unfinished", test_abort_all_discards_unfinished},
    {"destruction_deletes_partial", test_destruction_deletes_partial},
    {"avatar_payload_is_cached", test_avatar_payload_is_cached},
    {"avatar_payload_must_be_image", test_avatar_payload_must_be_image},
    {"listener_exception_is_contained", test_listener_exception_is_contained}
  };
  return woxxy::test::run_tests("coordinator", tests, argc, argv);
}
