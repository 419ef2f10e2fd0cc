#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <future>
#include <thread>

#include "pensync/obex/obex_codec.h"
#include "pensync/service/ftp_service.h"
#include "mocks/fake_transport.h"
#include "mocks/mock_file_transfer_session.h"
#include "mocks/recording_callbacks.h"
#include "mocks/scripted_obex_peer.h"
#include "mocks/temp_dir.h"

using namespace pensync;
using namespace pensync::service;
using namespace pensync::test;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

const char kPeerA[] = "btgoep://0017EC558162:2";
const char kPeerB[] = "btgoep://0017EC5581FF:2";

const char kListingXml[] =
    "<?xml version=\"1.0\"?>"
    "<!DOCTYPE folder-listing SYSTEM \"obex-folder-listing.dtd\">"
    "<folder-listing version=\"1.0\">"
    "<parent-folder/>"
    "<file name=\"old.png\" size=\"120\" modified=\"20140101T100000\"/>"
    "<folder name=\"ARCHIVE\"/>"
    "<file name=\"new.png\" size=\"340\" modified=\"20140301T100000\"/>"
    "</folder-listing>";

std::vector<uint8_t> folderTarget() {
  return std::vector<uint8_t>(obex::kFolderBrowsingTarget.begin(),
                              obex::kFolderBrowsingTarget.end());
}

IoResult<uint8_t> sendBody(const std::string& body,
                           size_t chunk,
                           const obex::BodySink& sink) {
  for (size_t pos = 0; pos < body.size(); pos += chunk) {
    size_t n = std::min(chunk, body.size() - pos);
    sink(reinterpret_cast<const uint8_t*>(body.data()) + pos, n);
  }
  return responseCode(obex::kResponseSuccess);
}

}  // namespace

class FtpServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    endpoint_ = std::make_shared<FakeEndpoint>();
    session_ = std::make_shared<NiceMock<MockFileTransferSession>>();
    ON_CALL(*session_, teardown())
        .WillByDefault(Return(IoVoidResult::success()));
  }

  void TearDown() override { service_.reset(); }

  void createService(FtpServiceConfig config = FtpServiceConfig(),
                     DeviceDiscoverySharedPtr discovery = nullptr) {
    auto session = session_;
    service_ = std::make_unique<FtpService>(
        std::move(config), endpoint_, std::move(discovery),
        [session](transport::ConnectionPtr, bool) { return session; });
    service_->addCallbacks(&recorder_);
  }

  FakeConnectionPtr addPeer(const std::string& address) {
    auto connection = std::make_shared<FakeConnection>(address);
    endpoint_->addConnection(address, connection);
    return connection;
  }

  void connectTo(const std::string& address) {
    ON_CALL(*session_, negotiate(_))
        .WillByDefault(Return(negotiated(obex::kResponseSuccess, 7u)));
    addPeer(address);
    service_->connect(address);
    ASSERT_TRUE(recorder_.waitFor(stateEvent(ConnectionState::Connecting,
                                             ConnectionState::Connected)));
  }

  std::vector<std::string> listedNames() const {
    std::vector<std::string> names;
    auto listing = recorder_.listing();
    if (listing) {
      for (const auto& item : *listing) {
        names.push_back(item.name());
      }
    }
    return names;
  }

  std::shared_ptr<FakeEndpoint> endpoint_;
  std::shared_ptr<NiceMock<MockFileTransferSession>> session_;
  FtpRecorder recorder_;
  std::unique_ptr<FtpService> service_;
};

TEST_F(FtpServiceTest, ConnectNegotiatesFolderBrowsing) {
  createService();
  EXPECT_CALL(*session_, negotiate(folderTarget()))
      .WillOnce(Return(negotiated(obex::kResponseSuccess, 7u)));
  addPeer(kPeerA);

  service_->connect(kPeerA);
  ASSERT_TRUE(recorder_.waitFor(stateEvent(ConnectionState::Connecting,
                                           ConnectionState::Connected)));

  EXPECT_EQ(recorder_.events(),
            (std::vector<std::string>{
                stateEvent(ConnectionState::Disconnected,
                           ConnectionState::Connecting),
                "connect:Ok:7",
                stateEvent(ConnectionState::Connecting,
                           ConnectionState::Connected)}));
  EXPECT_EQ(service_->state(), ConnectionState::Connected);
  EXPECT_EQ(service_->directory(), "/");
  EXPECT_EQ(service_->connectedDevice(), optional<std::string>(kPeerA));
}

TEST_F(FtpServiceTest, DialFailureReturnsToDisconnected) {
  createService();
  EXPECT_CALL(*session_, negotiate(_)).Times(0);

  service_->connect("btgoep://000000000000:2");
  ASSERT_TRUE(recorder_.waitFor(stateEvent(ConnectionState::Connecting,
                                           ConnectionState::Disconnected)));
  EXPECT_EQ(recorder_.count("connect:Ok:7"), 0u);
  EXPECT_EQ(service_->state(), ConnectionState::Disconnected);
  EXPECT_FALSE(service_->connectedDevice().has_value());
}

TEST_F(FtpServiceTest, RefusedNegotiationFailsConnect) {
  createService();
  EXPECT_CALL(*session_, negotiate(_))
      .WillOnce(Return(negotiated(obex::kResponseForbidden)));
  auto connection = addPeer(kPeerA);

  service_->connect(kPeerA);
  ASSERT_TRUE(recorder_.waitFor(stateEvent(ConnectionState::Connecting,
                                           ConnectionState::Disconnected)));

  auto events = recorder_.events();
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[1], "connect:Fail");
  EXPECT_TRUE(connection->closed());
}

TEST_F(FtpServiceTest, OperationsRejectedWhenNotConnected) {
  createService();
  EXPECT_FALSE(service_->listFolder("SAVED"));
  EXPECT_FALSE(service_->changeFolder("SAVED"));
  EXPECT_FALSE(service_->getFile("a.png"));
  EXPECT_FALSE(service_->deleteFile("a.png"));
  EXPECT_EQ(service_->directory(), "");
}

TEST_F(FtpServiceTest, DisconnectWhenDisconnectedIsNoOp) {
  createService();
  EXPECT_CALL(*session_, teardown()).Times(0);

  service_->disconnect();
  EXPECT_EQ(service_->state(), ConnectionState::Disconnected);
  EXPECT_TRUE(recorder_.events().empty());
}

TEST_F(FtpServiceTest, DisconnectTearsDownSession) {
  createService();
  connectTo(kPeerA);
  EXPECT_CALL(*session_, teardown())
      .WillOnce(Return(IoVoidResult::success()));

  service_->disconnect();
  ASSERT_TRUE(recorder_.waitFor("disconnect:Ok"));

  auto events = recorder_.events();
  ASSERT_GE(events.size(), 2u);
  EXPECT_EQ(events[events.size() - 2],
            stateEvent(ConnectionState::Connected,
                       ConnectionState::Disconnected));
  EXPECT_EQ(events.back(), "disconnect:Ok");
  EXPECT_EQ(service_->state(), ConnectionState::Disconnected);
  EXPECT_EQ(service_->directory(), "");
  EXPECT_FALSE(service_->connectedDevice().has_value());
}

TEST_F(FtpServiceTest, DisconnectReportsTeardownFailure) {
  createService();
  connectTo(kPeerA);
  EXPECT_CALL(*session_, teardown())
      .WillOnce(Return(IoVoidResult::error(EPIPE, "broken pipe")));

  service_->disconnect();
  ASSERT_TRUE(recorder_.waitFor("disconnect:Fail"));
  EXPECT_EQ(service_->state(), ConnectionState::Disconnected);
}

TEST_F(FtpServiceTest, ListFolderEntersFolderAndSortsItems) {
  createService();
  connectTo(kPeerA);
  EXPECT_CALL(*session_, setRemotePath("SAVED"))
      .WillOnce(Return(responseCode(obex::kResponseSuccess)));
  EXPECT_CALL(*session_, get(_, _))
      .WillOnce([](const obex::GetRequest& request,
                   const obex::BodySink& sink) {
        EXPECT_FALSE(request.name.has_value());
        EXPECT_EQ(request.type.value_or(""), obex::kFolderListingType);
        return sendBody(kListingXml, 50, sink);
      });

  ASSERT_TRUE(service_->listFolder("SAVED"));
  ASSERT_TRUE(recorder_.waitFor("list:Ok"));

  EXPECT_EQ(listedNames(),
            (std::vector<std::string>{"ARCHIVE", "new.png", "old.png"}));
  EXPECT_EQ(service_->directory(), "/SAVED");
}

TEST_F(FtpServiceTest, ListFolderRefusedAtSetPath) {
  createService();
  connectTo(kPeerA);
  EXPECT_CALL(*session_, setRemotePath("MISSING"))
      .WillOnce(Return(responseCode(obex::kResponseNotFound)));
  EXPECT_CALL(*session_, get(_, _)).Times(0);

  ASSERT_TRUE(service_->listFolder("MISSING"));
  ASSERT_TRUE(recorder_.waitFor("list:Fail"));
  EXPECT_FALSE(recorder_.listing().has_value());
  EXPECT_EQ(service_->directory(), "/");
  EXPECT_EQ(service_->state(), ConnectionState::Connected);
}

TEST_F(FtpServiceTest, ListFolderKeepsEnteredFolderWhenListingFails) {
  createService();
  connectTo(kPeerA);
  EXPECT_CALL(*session_, setRemotePath("SAVED"))
      .WillOnce(Return(responseCode(obex::kResponseSuccess)));
  EXPECT_CALL(*session_, get(_, _))
      .WillOnce(Return(responseCode(obex::kResponseForbidden)));

  ASSERT_TRUE(service_->listFolder("SAVED"));
  ASSERT_TRUE(recorder_.waitFor("list:Fail"));
  EXPECT_EQ(service_->directory(), "/SAVED");
}

TEST_F(FtpServiceTest, ChangeFolderTracksDirectory) {
  createService();
  connectTo(kPeerA);
  EXPECT_CALL(*session_, setRemotePath(_))
      .WillRepeatedly(Return(responseCode(obex::kResponseSuccess)));

  ASSERT_TRUE(service_->changeFolder("SAVED"));
  ASSERT_TRUE(recorder_.waitFor("cd:Ok:/SAVED"));
  EXPECT_EQ(service_->directory(), "/SAVED");

  ASSERT_TRUE(service_->changeFolder(".."));
  ASSERT_TRUE(recorder_.waitFor("cd:Ok:/"));
  EXPECT_EQ(service_->directory(), "/");
}

TEST_F(FtpServiceTest, ChangeFolderRefused) {
  createService();
  connectTo(kPeerA);
  EXPECT_CALL(*session_, setRemotePath("NOPE"))
      .WillOnce(Return(responseCode(obex::kResponseNotFound)));

  ASSERT_TRUE(service_->changeFolder("NOPE"));
  ASSERT_TRUE(recorder_.waitFor("cd:Fail:-"));
  EXPECT_EQ(service_->directory(), "/");
}

TEST_F(FtpServiceTest, GetFileStoresUnderRemoteBaseName) {
  TempDir store;
  ASSERT_FALSE(store.path().empty());
  FtpServiceConfig config;
  config.store_directory = store.path();
  createService(config);
  connectTo(kPeerA);

  EXPECT_CALL(*session_, get(_, _))
      .WillOnce([](const obex::GetRequest& request,
                   const obex::BodySink& sink) {
        EXPECT_EQ(request.name.value_or(""), "SAVED/note.png");
        EXPECT_FALSE(request.type.has_value());
        return sendBody("hello tablet", 5, sink);
      });

  ASSERT_TRUE(service_->getFile("SAVED/note.png"));
  ASSERT_TRUE(recorder_.waitFor("get:Ok:" + store.file("note.png")));
  EXPECT_EQ(store.read("note.png"), "hello tablet");
  EXPECT_FALSE(store.exists("note.png.part"));
}

TEST_F(FtpServiceTest, GetFileReplacesEarlierCopyOnSuccess) {
  TempDir store;
  store.write("note.png", "earlier copy, longer than the new one");
  FtpServiceConfig config;
  config.store_directory = store.path();
  createService(config);
  connectTo(kPeerA);
  EXPECT_CALL(*session_, get(_, _))
      .WillOnce([](const obex::GetRequest&, const obex::BodySink& sink) {
        return sendBody("fresh", 2, sink);
      });

  ASSERT_TRUE(service_->getFile("note.png"));
  ASSERT_TRUE(recorder_.waitFor("get:Ok:" + store.file("note.png")));
  EXPECT_EQ(store.read("note.png"), "fresh");
}

TEST_F(FtpServiceTest, RefusedGetFileKeepsEarlierCopy) {
  TempDir store;
  store.write("1.png", "old copy");
  FtpServiceConfig config;
  config.store_directory = store.path();
  createService(config);
  connectTo(kPeerA);
  EXPECT_CALL(*session_, get(_, _))
      .WillOnce([](const obex::GetRequest&, const obex::BodySink& sink) {
        const uint8_t partial[] = {'x', 'y'};
        sink(partial, sizeof(partial));
        return responseCode(obex::kResponseNotFound);
      });

  ASSERT_TRUE(service_->getFile("SAVED/1.png"));
  ASSERT_TRUE(recorder_.waitFor("get:Fail:-"));
  EXPECT_EQ(store.read("1.png"), "old copy");
  EXPECT_FALSE(store.exists("1.png.part"));
  EXPECT_EQ(service_->state(), ConnectionState::Connected);
}

TEST_F(FtpServiceTest, GetFileRejectsUnsafeNames) {
  TempDir store;
  FtpServiceConfig config;
  config.store_directory = store.path();
  createService(config);
  connectTo(kPeerA);
  EXPECT_CALL(*session_, get(_, _)).Times(0);

  ASSERT_TRUE(service_->getFile(".."));
  ASSERT_TRUE(service_->getFile("SAVED/"));
  ASSERT_TRUE(recorder_.waitForOccurrences("get:Fail:-", 2));
  EXPECT_EQ(service_->state(), ConnectionState::Connected);
}

TEST_F(FtpServiceTest, GetFileTransportErrorBreaksConnection) {
  TempDir store;
  FtpServiceConfig config;
  config.store_directory = store.path();
  createService(config);
  connectTo(kPeerA);
  EXPECT_CALL(*session_, get(_, _))
      .WillOnce([](const obex::GetRequest&, const obex::BodySink& sink) {
        const uint8_t partial[] = {1, 2, 3};
        sink(partial, sizeof(partial));
        return IoResult<uint8_t>::error(ECONNRESET, "connection reset");
      });

  ASSERT_TRUE(service_->getFile("note.png"));
  ASSERT_TRUE(recorder_.waitFor(stateEvent(ConnectionState::Connected,
                                           ConnectionState::Disconnected)));

  auto events = recorder_.events();
  ASSERT_GE(events.size(), 2u);
  EXPECT_EQ(events[events.size() - 2], "get:Fail:-");
  EXPECT_FALSE(store.exists("note.png"));
  EXPECT_FALSE(store.exists("note.png.part"));
  EXPECT_FALSE(service_->listFolder("SAVED"));
}

TEST_F(FtpServiceTest, GetFileTransportErrorKeepsEarlierCopy) {
  TempDir store;
  store.write("note.png", "old copy");
  FtpServiceConfig config;
  config.store_directory = store.path();
  createService(config);
  connectTo(kPeerA);
  EXPECT_CALL(*session_, get(_, _))
      .WillOnce([](const obex::GetRequest&, const obex::BodySink& sink) {
        const uint8_t partial[] = {1, 2, 3};
        sink(partial, sizeof(partial));
        return IoResult<uint8_t>::error(ECONNRESET, "connection reset");
      });

  ASSERT_TRUE(service_->getFile("note.png"));
  ASSERT_TRUE(recorder_.waitFor("get:Fail:-"));
  EXPECT_EQ(store.read("note.png"), "old copy");
  EXPECT_FALSE(store.exists("note.png.part"));
}

TEST_F(FtpServiceTest, DeleteFileReportsName) {
  createService();
  connectTo(kPeerA);
  EXPECT_CALL(*session_, remove("old.png"))
      .WillOnce(Return(responseCode(obex::kResponseSuccess)));
  EXPECT_CALL(*session_, remove("locked.png"))
      .WillOnce(Return(responseCode(obex::kResponseForbidden)));

  ASSERT_TRUE(service_->deleteFile("old.png"));
  ASSERT_TRUE(recorder_.waitFor("delete:Ok:old.png"));
  ASSERT_TRUE(service_->deleteFile("locked.png"));
  ASSERT_TRUE(recorder_.waitFor("delete:Fail:-"));
}

TEST_F(FtpServiceTest, RequestsCompleteInSubmissionOrder) {
  createService();
  connectTo(kPeerA);
  ON_CALL(*session_, remove(_))
      .WillByDefault(Return(responseCode(obex::kResponseSuccess)));

  ASSERT_TRUE(service_->deleteFile("1.png"));
  ASSERT_TRUE(service_->deleteFile("2.png"));
  ASSERT_TRUE(service_->deleteFile("3.png"));
  ASSERT_TRUE(recorder_.waitFor("delete:Ok:3.png"));

  auto events = recorder_.events();
  std::vector<std::string> deletes(events.end() - 3, events.end());
  EXPECT_EQ(deletes, (std::vector<std::string>{"delete:Ok:1.png",
                                               "delete:Ok:2.png",
                                               "delete:Ok:3.png"}));
}

TEST_F(FtpServiceTest, NewerConnectSupersedesPendingAttempt) {
  createService();
  EXPECT_CALL(*session_, negotiate(_))
      .WillOnce(Return(negotiated(obex::kResponseSuccess, 7u)));
  auto stale = addPeer(kPeerA);
  endpoint_->hold(kPeerA);

  service_->connect(kPeerA);
  ASSERT_TRUE(endpoint_->waitForDial(kPeerA));

  addPeer(kPeerB);
  service_->connect(kPeerB);
  ASSERT_TRUE(recorder_.waitFor(stateEvent(ConnectionState::Connecting,
                                           ConnectionState::Connected)));

  endpoint_->release(kPeerA);
  EXPECT_TRUE(stale->waitForClose());

  // Anything the old attempt posted is dropped; disconnect() events queue
  // behind it.
  service_->disconnect();
  ASSERT_TRUE(recorder_.waitFor("disconnect:Ok"));
  EXPECT_EQ(recorder_.events(),
            (std::vector<std::string>{
                stateEvent(ConnectionState::Disconnected,
                           ConnectionState::Connecting),
                "connect:Ok:7",
                stateEvent(ConnectionState::Connecting,
                           ConnectionState::Connected),
                stateEvent(ConnectionState::Connected,
                           ConnectionState::Disconnected),
                "disconnect:Ok"}));
}

TEST_F(FtpServiceTest, ConnectWhileConnectedReplacesSession) {
  createService();
  connectTo(kPeerA);
  // The old session is closed, not disconnected
  EXPECT_CALL(*session_, teardown()).Times(0);
  EXPECT_CALL(*session_, abort()).Times(AtLeast(1));

  addPeer(kPeerB);
  service_->connect(kPeerB);
  ASSERT_TRUE(recorder_.waitForOccurrences(
      stateEvent(ConnectionState::Connecting, ConnectionState::Connected), 2));
  EXPECT_EQ(recorder_.count(stateEvent(ConnectionState::Connected,
                                       ConnectionState::Connecting)),
            1u);
  EXPECT_EQ(service_->connectedDevice(), optional<std::string>(kPeerB));
}

TEST_F(FtpServiceTest, StartConnectsToFirstConfiguredDevice) {
  FtpServiceConfig config;
  config.devices = {kPeerA, kPeerB};
  createService(config);
  ON_CALL(*session_, negotiate(_))
      .WillByDefault(Return(negotiated(obex::kResponseSuccess, 1u)));
  addPeer(kPeerA);

  EXPECT_TRUE(service_->start());
  ASSERT_TRUE(recorder_.waitFor(stateEvent(ConnectionState::Connecting,
                                           ConnectionState::Connected)));
  EXPECT_EQ(endpoint_->dials(), (std::vector<std::string>{kPeerA}));
}

TEST_F(FtpServiceTest, StartWhileConnectingKeepsPendingAttempt) {
  FtpServiceConfig config;
  config.devices = {kPeerA};
  createService(config);
  ON_CALL(*session_, negotiate(_))
      .WillByDefault(Return(negotiated(obex::kResponseSuccess, 1u)));
  addPeer(kPeerA);
  endpoint_->hold(kPeerA);

  EXPECT_TRUE(service_->start());
  ASSERT_TRUE(endpoint_->waitForDial(kPeerA));
  EXPECT_TRUE(service_->start());
  EXPECT_EQ(service_->state(), ConnectionState::Connecting);

  endpoint_->release(kPeerA);
  ASSERT_TRUE(recorder_.waitFor(stateEvent(ConnectionState::Connecting,
                                           ConnectionState::Connected)));
  EXPECT_EQ(endpoint_->dials(), (std::vector<std::string>{kPeerA}));
  EXPECT_EQ(recorder_.count("connect:Ok:1"), 1u);
  EXPECT_EQ(recorder_.count(stateEvent(ConnectionState::Disconnected,
                                       ConnectionState::Connecting)),
            1u);
}

TEST_F(FtpServiceTest, StartWithoutDevicesFails) {
  createService();
  EXPECT_FALSE(service_->start());
  EXPECT_EQ(service_->state(), ConnectionState::Disconnected);
  EXPECT_TRUE(endpoint_->dials().empty());
}

TEST_F(FtpServiceTest, StartDiscoversSyncDevices) {
  auto discovery = std::make_shared<MockDeviceDiscovery>();
  std::map<std::string, PeerRecord> peers;
  peers["0017EC558162"] = {kSyncDeviceKind,
                           std::string("Boogie Board Sync\n") + kPeerA};
  EXPECT_CALL(*discovery, findPeers(ServiceClass::FileTransfer))
      .WillOnce(Return(peers));

  createService(FtpServiceConfig(), discovery);
  ON_CALL(*session_, negotiate(_))
      .WillByDefault(Return(negotiated(obex::kResponseSuccess, 1u)));
  addPeer(kPeerA);

  EXPECT_TRUE(service_->start());
  ASSERT_TRUE(recorder_.waitFor(stateEvent(ConnectionState::Connecting,
                                           ConnectionState::Connected)));
  EXPECT_EQ(service_->deviceAddresses(), (std::vector<std::string>{kPeerA}));
}

TEST_F(FtpServiceTest, StopReturnsToDisconnected) {
  createService();
  connectTo(kPeerA);
  EXPECT_CALL(*session_, teardown()).Times(0);
  EXPECT_CALL(*session_, abort()).Times(AtLeast(1));

  service_->stop();
  EXPECT_EQ(service_->state(), ConnectionState::Disconnected);
  EXPECT_FALSE(service_->getFile("a.png"));
  ASSERT_TRUE(recorder_.waitFor(stateEvent(ConnectionState::Connected,
                                           ConnectionState::Disconnected)));
}

TEST_F(FtpServiceTest, RemovedCallbacksAreNotCalled) {
  createService();
  FtpRecorder other;
  EXPECT_TRUE(service_->addCallbacks(&other));
  EXPECT_FALSE(service_->addCallbacks(&other));
  EXPECT_TRUE(service_->removeCallbacks(&other));

  connectTo(kPeerA);
  EXPECT_TRUE(other.events().empty());
}

TEST(FtpServiceObexTest, ListsFolderOverObex) {
  auto endpoint = std::make_shared<FakeEndpoint>();
  auto connection = std::make_shared<FakeConnection>(kPeerA);
  endpoint->addConnection(kPeerA, connection);

  ScriptedObexPeer peer(connection);
  peer.queueConnectSuccess(3);
  peer.queueCode(obex::kResponseSuccess);
  peer.queueBody(kListingXml, 100);

  FtpRecorder recorder;
  FtpService service(FtpServiceConfig(), endpoint);
  service.addCallbacks(&recorder);

  service.connect(kPeerA);
  ASSERT_TRUE(recorder.waitFor("connect:Ok:3"));
  ASSERT_TRUE(recorder.waitFor(stateEvent(ConnectionState::Connecting,
                                          ConnectionState::Connected)));
  ASSERT_TRUE(service.listFolder("SAVED"));
  ASSERT_TRUE(recorder.waitFor("list:Ok"));

  auto listing = recorder.listing();
  ASSERT_TRUE(listing.has_value());
  ASSERT_EQ(listing->size(), 3u);
  EXPECT_EQ((*listing)[0].name(), "ARCHIVE");
  EXPECT_EQ(service.directory(), "/SAVED");

  auto requests = peer.requests();
  ASSERT_GE(requests.size(), 3u);
  EXPECT_EQ(requests[0][0], obex::kOpConnect);
  EXPECT_EQ(requests[1][0], obex::kOpSetPath);

  service.stop();
}

TEST(FtpServiceObexTest, StalledDisconnectLeavesServiceResponsive) {
  auto endpoint = std::make_shared<FakeEndpoint>();
  auto connection = std::make_shared<FakeConnection>(kPeerA);
  endpoint->addConnection(kPeerA, connection);

  ScriptedObexPeer peer(connection);
  peer.queueConnectSuccess(3);

  FtpRecorder recorder;
  FtpService service(FtpServiceConfig(), endpoint);
  service.addCallbacks(&recorder);

  service.connect(kPeerA);
  ASSERT_TRUE(recorder.waitFor(stateEvent(ConnectionState::Connecting,
                                          ConnectionState::Connected)));

  // The peer stops draining: the DISCONNECT write hangs until close()
  connection->setBlockWrites(true);
  std::thread disconnecting([&service]() { service.disconnect(); });
  ASSERT_TRUE(connection->waitForBlockedWrite());

  auto state = std::async(std::launch::async,
                          [&service]() { return service.state(); });
  bool responsive =
      state.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
  if (!responsive) {
    connection->close();
  }
  EXPECT_TRUE(responsive);
  EXPECT_EQ(state.get(), ConnectionState::Disconnected);
  EXPECT_FALSE(service.listFolder("SAVED"));

  // stop() closes the transport, which releases the stalled write
  service.stop();
  EXPECT_TRUE(connection->waitForClose());
  disconnecting.join();

  ASSERT_TRUE(recorder.waitFor("disconnect:Fail"));
  EXPECT_EQ(recorder.events().back(), "disconnect:Fail");
}

TEST(FtpServiceObexTest, StopClosesStalledSessionWithoutWriting) {
  auto endpoint = std::make_shared<FakeEndpoint>();
  auto connection = std::make_shared<FakeConnection>(kPeerA);
  endpoint->addConnection(kPeerA, connection);

  ScriptedObexPeer peer(connection);
  peer.queueConnectSuccess(3);

  FtpRecorder recorder;
  FtpService service(FtpServiceConfig(), endpoint);
  service.addCallbacks(&recorder);

  service.connect(kPeerA);
  ASSERT_TRUE(recorder.waitFor(stateEvent(ConnectionState::Connecting,
                                          ConnectionState::Connected)));

  connection->setBlockWrites(true);
  service.stop();

  EXPECT_TRUE(connection->closed());
  EXPECT_EQ(service.state(), ConnectionState::Disconnected);
  auto requests = peer.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0][0], obex::kOpConnect);
}

TEST(FtpServiceObexTest, ConnectClosesStalledSessionOfPreviousPeer) {
  auto endpoint = std::make_shared<FakeEndpoint>();
  auto first = std::make_shared<FakeConnection>(kPeerA);
  auto second = std::make_shared<FakeConnection>(kPeerB);
  endpoint->addConnection(kPeerA, first);
  endpoint->addConnection(kPeerB, second);

  ScriptedObexPeer peer_a(first);
  peer_a.queueConnectSuccess(3);
  ScriptedObexPeer peer_b(second);
  peer_b.queueConnectSuccess(4);

  FtpRecorder recorder;
  FtpService service(FtpServiceConfig(), endpoint);
  service.addCallbacks(&recorder);

  service.connect(kPeerA);
  ASSERT_TRUE(recorder.waitFor("connect:Ok:3"));
  ASSERT_TRUE(recorder.waitFor(stateEvent(ConnectionState::Connecting,
                                          ConnectionState::Connected)));

  first->setBlockWrites(true);
  service.connect(kPeerB);
  EXPECT_TRUE(first->closed());

  ASSERT_TRUE(recorder.waitFor("connect:Ok:4"));
  ASSERT_TRUE(recorder.waitForOccurrences(
      stateEvent(ConnectionState::Connecting, ConnectionState::Connected), 2));
  EXPECT_EQ(service.connectedDevice(), optional<std::string>(kPeerB));
  EXPECT_EQ(peer_a.requests().size(), 1u);

  service.stop();
}

TEST(ResolveRemoteDirectoryTest, Resolution) {
  EXPECT_EQ(resolveRemoteDirectory("/", "SAVED"), "/SAVED");
  EXPECT_EQ(resolveRemoteDirectory("/SAVED", "2014"), "/SAVED/2014");
  EXPECT_EQ(resolveRemoteDirectory("/SAVED/2014", ".."), "/SAVED");
  EXPECT_EQ(resolveRemoteDirectory("/SAVED", ".."), "/");
  EXPECT_EQ(resolveRemoteDirectory("/", ".."), "/");
  EXPECT_EQ(resolveRemoteDirectory("/SAVED", ""), "/");
  EXPECT_EQ(resolveRemoteDirectory("/SAVED", "/"), "/");
  EXPECT_EQ(resolveRemoteDirectory("", "SAVED"), "/SAVED");
}

TEST(PendingActionTest, CompletionKinds) {
  EXPECT_EQ(pendingActionOf(ConnectCompletion{}), PendingAction::Connect);
  EXPECT_EQ(pendingActionOf(DisconnectCompletion{}),
            PendingAction::Disconnect);
  EXPECT_EQ(pendingActionOf(DeleteCompletion{}), PendingAction::Delete);
  EXPECT_EQ(pendingActionOf(ChangeFolderCompletion{}),
            PendingAction::ChangeFolder);
  EXPECT_EQ(pendingActionOf(GetFileCompletion{}), PendingAction::GetFile);
  EXPECT_EQ(pendingActionOf(FolderListingCompletion{}),
            PendingAction::ListFolder);
}
