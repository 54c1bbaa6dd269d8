#include <lw/etcd_node_watcher.hpp>
#include <lw/log.hpp>
#include <lw/master_address_tracker.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace {
// ... set by the signal handler and the abort handler, read by the main and canceller threads ...
std::atomic<bool> interrupt(false);
extern "C" void signal_handler(int sig) {
  interrupt.store(true);
}

/// Join a thread on scope exit, a joinable std::thread destructor calls std::terminate().
class joining_thread {
public:
  explicit joining_thread(std::thread t)
      : thread_(std::move(t)) {
  }
  ~joining_thread() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  joining_thread(joining_thread const&) = delete;
  joining_thread& operator=(joining_thread const&) = delete;

private:
  std::thread thread_;
};

void print_master(lw::master_address_tracker const& tracker) {
  try {
    auto master = tracker.master_address();
    if (not master) {
      std::cout << "no current master" << std::endl;
      return;
    }
    std::cout << "current master is " << *master << std::endl;
  } catch (lw::malformed_address const& ex) {
    std::cout << "malformed master address: " << ex.what() << std::endl;
  }
}
} // anonymous namespace

int main(int argc, char* argv[]) try {
  if (argc < 2 or argc > 5) {
    std::cerr << "Usage: " << argv[0] << " <path> [etcd-address] [wait-timeout-ms] [log-level]" << std::endl;
    return 1;
  }
  std::string path = argv[1];
  lw::watcher_config config;
  if (argc >= 3) {
    config.etcd_address = argv[2];
  }
  std::chrono::milliseconds wait_timeout(0);
  if (argc >= 4) {
    wait_timeout = std::chrono::milliseconds(std::stol(argv[3]));
    if (wait_timeout.count() < 0) {
      std::cerr << "wait-timeout-ms must be >= 0, use 0 to wait forever" << std::endl;
      return 1;
    }
  }
  config.validate();

  lw::log::instance().add_sink(lw::make_ostream_log_sink(std::cerr));
  if (argc >= 5) {
    lw::log::instance().min_severity(lw::parse_severity(argv[4]));
  }
  LW_LOG(info) << "watching " << path << " with " << config;

  std::signal(SIGINT, &signal_handler);
  std::signal(SIGTERM, &signal_handler);

  auto etcd_channel = grpc::CreateChannel(config.etcd_address, grpc::InsecureChannelCredentials());
  auto queue = std::make_shared<lw::active_completion_queue>();

  lw::watched_value node(path, lw::master_address_tracker::log_identity());
  lw::cancellation_token token;
  auto abort_handler = lw::make_abortable([](std::string const& why) {
    LW_LOG(critical) << "aborting: " << why;
    interrupt.store(true);
  });
  lw::etcd_node_watcher watcher(queue, etcd_channel, node, abort_handler, config);
  watcher.startup();

  lw::master_address_tracker tracker(node);

  // ... the signal handler cannot call cancel(), a helper thread does it for the handler ...
  // ... stop is destroyed first, it releases the canceller before joining_thread joins it ...
  std::atomic<bool> done(false);
  struct stop_canceller {
    std::atomic<bool>& done;
    ~stop_canceller() {
      done.store(true);
    }
  };
  joining_thread canceller(std::thread([&token, &done]() {
    using namespace std::chrono_literals;
    while (not interrupt.load() and not done.load()) {
      std::this_thread::sleep_for(20ms);
    }
    token.cancel();
  }));
  stop_canceller stop{done};

  try {
    auto master = tracker.wait_for_master(wait_timeout, token);
    if (not master) {
      std::cout << "no master after " << wait_timeout.count() << "ms" << std::endl;
    } else {
      std::cout << "master is " << *master << std::endl;
    }
  } catch (lw::wait_cancelled const&) {
    std::cout << "interrupted while waiting for a master" << std::endl;
  } catch (lw::malformed_address const& ex) {
    std::cout << "malformed master address: " << ex.what() << std::endl;
  }

  // ... print every change until a signal is received ...
  auto version = node.version();
  using namespace std::chrono_literals;
  while (not interrupt.load()) {
    std::this_thread::sleep_for(20ms);
    auto current = node.version();
    if (current != version) {
      version = current;
      print_master(tracker);
    }
  }

  watcher.shutdown();
  return 0;
} catch (std::exception const& ex) {
  std::cerr << "std::exception raised: " << ex.what() << std::endl;
  return 1;
}
