#include <catch2/catch.hpp>

#include <Codec.hpp>
#include <DeviceSession.hpp>
#include <Errors.hpp>
#include <ISerialPort.hpp>
#include <RT73.hpp>

#include "test_utils.hpp"

#include <map>

namespace {

struct RecordingListener : IProgressListener {
  void onProgress(std::string_view what, std::size_t done,
                  std::size_t total) override {
    auto &[last, expected] = progress[std::string{what}];
    REQUIRE(done > last);
    REQUIRE(done <= total);
    last = done;
    expected = total;
  }
  // region -> (last done, total)
  std::map<std::string, std::pair<std::size_t, std::size_t>> progress;
};

} // namespace

TEST_CASE("session handshake", "[session]") {
  auto objs = setup();
  rt73::DeviceSession session{rt73map::codeplug_map(), *objs.framer};
  REQUIRE(session.state() == rt73::SessionState::DISCONNECTED);
  {
    auto guard = session.connect();
    REQUIRE(session.state() == rt73::SessionState::CONNECTED);
    REQUIRE(session.ident() == "RT73 MOCK");
    REQUIRE_THROWS_AS(session.connect(), rt73::SessionStateError);
  }
  REQUIRE(session.state() == rt73::SessionState::DISCONNECTED);
}

TEST_CASE("transfers need a connection", "[session]") {
  auto objs = setup();
  rt73::DeviceSession session{rt73map::codeplug_map(), *objs.framer};
  REQUIRE_THROWS_AS(session.download(), rt73::SessionStateError);
  REQUIRE_THROWS_AS(session.upload(byte_vector(rt73map::codeplug_size)),
                    rt73::SessionStateError);
  REQUIRE(objs.radio().requests().empty());
}

TEST_CASE("download edit upload", "[session]") {
  auto objs = setup();
  const auto map = rt73map::codeplug_map();
  const rt73::Codec codec{map};
  const auto original = codec.encode(sample_records());
  objs.radio().write(0, original);

  rt73::DeviceSession session{map, *objs.framer};
  auto guard = session.connect();
  RecordingListener listener;
  const auto image = session.download(&listener);
  REQUIRE(image == original);
  REQUIRE(session.state() == rt73::SessionState::CONNECTED);
  REQUIRE(listener.progress.size() == map.regions().size());
  REQUIRE(listener.progress.at("channels").first == 1024 * 32);

  auto set = codec.decode(image);
  set.at("channels").find(1)->at("name") = "Relay"s;
  session.upload(codec.encode(set));
  REQUIRE(session.state() == rt73::SessionState::CONNECTED);

  const auto stored = objs.radio().read(0, rt73map::codeplug_size);
  const auto &channels = map.region_for("channels");
  const auto name_start = channels.slot_offset(1) + 0x02;
  for (std::uint32_t i = 0; i < stored.size(); ++i) {
    if (stored[i] != original[i]) {
      REQUIRE(i >= name_start);
      REQUIRE(i < name_start + 10);
    }
  }
  REQUIRE(codec.decode(stored) == set);
}

TEST_CASE("upload rejects a wrong sized image", "[session]") {
  auto objs = setup();
  rt73::DeviceSession session{rt73map::codeplug_map(), *objs.framer};
  auto guard = session.connect();
  REQUIRE_THROWS_AS(session.upload(byte_vector(100, 0xFF)), rt73::EncodeError);
  REQUIRE(session.state() == rt73::SessionState::CONNECTED);
}

TEST_CASE("read back verification", "[session]") {
  auto objs = setup();
  const auto map = rt73map::codeplug_map();
  const auto image = rt73::Codec{map}.encode(sample_records());
  const auto &channels = map.region_for("channels");
  objs.radio().corrupt_writes_at(channels.slot_offset(0) + 0x02);

  rt73::DeviceSession session{map, *objs.framer};
  auto guard = session.connect();
  try {
    session.upload(image);
    FAIL("expected a verification error");
  } catch (const rt73::VerificationError &e) {
    REQUIRE(e.region == "channels");
    REQUIRE(e.offset == 0x02);
  }
  REQUIRE(session.state() == rt73::SessionState::DISCONNECTED);
  // no implicit reconnect
  REQUIRE_THROWS_AS(session.download(), rt73::SessionStateError);
}

TEST_CASE("verification can be disabled", "[session]") {
  rt73::ProtocolProfile profile{};
  profile.readback_verify = false;
  auto objs = setup(profile);
  const auto map = rt73map::codeplug_map();
  objs.radio().corrupt_writes_at(
      map.region_for("channels").slot_offset(0) + 0x02);

  rt73::DeviceSession session{map, *objs.framer};
  auto guard = session.connect();
  REQUIRE_NOTHROW(session.upload(rt73::Codec{map}.encode(sample_records())));
  REQUIRE(objs.radio().count_requests(profile.opcodes.read) == 0);
}

TEST_CASE("transport failure drops the session", "[session]") {
  auto objs = setup();
  rt73::DeviceSession session{rt73map::codeplug_map(), *objs.framer};
  auto guard = session.connect();
  objs.radio().drop_responses(MockRadio::forever);
  REQUIRE_THROWS_AS(session.download(), rt73::TransportError);
  REQUIRE(session.state() == rt73::SessionState::DISCONNECTED);

  objs.radio().drop_responses(0);
  auto again = session.connect();
  REQUIRE(session.download().size() == rt73map::codeplug_size);
}

TEST_CASE("factory radio holds a blank codeplug", "[session]") {
  auto objs = setup();
  const auto map = rt73map::codeplug_map();
  rt73::DeviceSession session{map, *objs.framer};
  auto guard = session.connect();
  const auto set = rt73::Codec{map}.decode(session.download());
  REQUIRE(set.regions.size() == map.regions().size());
  for (const auto &r : set.regions) {
    REQUIRE(r.records.empty());
  }
}

TEST_CASE("cancelled download", "[session]") {
  auto objs = setup();
  rt73::DeviceSession session{rt73map::codeplug_map(), *objs.framer};
  auto guard = session.connect();
  ISerialPort::request_stop();
  REQUIRE_THROWS_AS(session.download(), ISerialPort::Interrupted);
  REQUIRE(session.state() == rt73::SessionState::DISCONNECTED);
}
