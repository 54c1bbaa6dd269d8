#include "lw/etcd_node_watcher.hpp"
#include <lw/master_address_tracker.hpp>

#include <etcdserverpb/rpc.grpc.pb.h>

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <sstream>
#include <thread>

namespace {
using namespace std::chrono_literals;

std::string const etcd_address = "localhost:22379";

/// Create a unique path for each test, so they can run against a shared etcd server.
std::string test_path(char const* name) {
  std::ostringstream os;
  os << "/leadwatch-test/" << name << "/" << std::hex
     << std::chrono::steady_clock::now().time_since_epoch().count();
  return os.str();
}

/// Write to etcd, the library itself never does.
class etcd_writer {
public:
  etcd_writer(lw::completion_queue<>& queue, std::shared_ptr<grpc::Channel> channel)
      : queue_(queue)
      , kv_(etcdserverpb::KV::NewStub(channel)) {
  }

  void put(std::string const& key, std::string const& value) {
    etcdserverpb::PutRequest req;
    req.set_key(key);
    req.set_value(value);
    queue_.async_rpc(kv_.get(), &etcdserverpb::KV::Stub::AsyncPut, std::move(req), "test/put", lw::use_future()).get();
  }

  void del(std::string const& key) {
    etcdserverpb::DeleteRangeRequest req;
    req.set_key(key);
    queue_
        .async_rpc(kv_.get(), &etcdserverpb::KV::Stub::AsyncDeleteRange, std::move(req), "test/del", lw::use_future())
        .get();
  }

private:
  lw::completion_queue<>& queue_;
  std::unique_ptr<etcdserverpb::KV::Stub> kv_;
};

/// Poll until the predicate is true, with exponential backoff.
template <typename Predicate>
void sleep_until(Predicate predicate) {
  auto s = 10ms;
  for (int i = 0; i != 10; ++i) {
    if (predicate()) {
      break;
    }
    std::this_thread::sleep_for(s);
    s *= 2;
  }
}
} // anonymous namespace

/**
 * @test Verify that lw::etcd_node_watcher follows creation, updates and deletion of a key.
 */
TEST(etcd_node_watcher, basic) {
  auto channel = grpc::CreateChannel(etcd_address, grpc::InsecureChannelCredentials());
  auto queue = std::make_shared<lw::active_completion_queue>();
  etcd_writer writer(queue->cq(), channel);

  auto const path = test_path("basic");
  lw::watched_value node(path, lw::master_address_tracker::log_identity());
  int aborts = 0;
  lw::etcd_node_watcher watcher(queue, channel, node, lw::make_abortable([&aborts](std::string const&) { ++aborts; }));
  EXPECT_EQ(path, watcher.path());
  ASSERT_NO_THROW(watcher.startup());

  lw::master_address_tracker tracker(node);
  EXPECT_FALSE(tracker.has_master());
  EXPECT_FALSE((bool)tracker.wait_for_master(50ms));

  // ... a waiter blocked before the key is created gets the address ...
  auto waiter = std::async(std::launch::async, [&tracker]() { return tracker.wait_for_master(5000ms); });
  writer.put(path, "master.example.com:16000");
  auto master = waiter.get();
  ASSERT_TRUE((bool)master);
  EXPECT_EQ(lw::server_address("master.example.com", 16000), *master);

  writer.put(path, "backup.example.com:16000");
  sleep_until([&tracker]() {
    auto m = tracker.master_address();
    return m and m->host() == "backup.example.com";
  });
  master = tracker.master_address();
  ASSERT_TRUE((bool)master);
  EXPECT_EQ("backup.example.com", master->host());

  writer.del(path);
  sleep_until([&tracker]() { return not tracker.has_master(); });
  EXPECT_FALSE(tracker.has_master());

  watcher.shutdown();
  EXPECT_TRUE(node.stopped());
  EXPECT_EQ(0, aborts);
}

/**
 * @test Verify that startup() reads the value of an existing key.
 */
TEST(etcd_node_watcher, existing_key) {
  auto channel = grpc::CreateChannel(etcd_address, grpc::InsecureChannelCredentials());
  auto queue = std::make_shared<lw::active_completion_queue>();
  etcd_writer writer(queue->cq(), channel);

  auto const path = test_path("existing_key");
  writer.put(path, "[::1]:16000");

  lw::watched_value node(path, lw::master_address_tracker::log_identity());
  {
    lw::etcd_node_watcher watcher(queue, channel, node, lw::make_abortable([](std::string const&) {}));
    watcher.startup();

    lw::master_address_tracker tracker(node);
    auto master = tracker.master_address();
    ASSERT_TRUE((bool)master);
    EXPECT_EQ(lw::server_address("::1", 16000), *master);
  }
  // ... the destructor stops the watcher too ...
  EXPECT_TRUE(node.stopped());
  writer.del(path);
}
