//   Copyright 2017 Carlos O'Ryan
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.
#include "lw/log.hpp"

#include <vector>

namespace {
std::once_flag log_initialized;
} // anonymous namespace

namespace lw {

std::unique_ptr<log> log::singleton_;

log& log::instance() {
  std::call_once(log_initialized, []() { singleton_.reset(new log); });
  return *singleton_;
}

long log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> guard(mu_);
  auto token = ++last_token_;
  sinks_.emplace(token, std::move(sink));
  return token;
}

void log::remove_sink(long token) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.erase(token);
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.clear();
}

void log::write(severity sev, std::string&& msg) {
  // ... a sink may log, or the application may add sinks, while the lines are written, do not hold the lock ...
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> guard(mu_);
    if (sev < min_severity_) {
      return;
    }
    for (auto const& kv : sinks_) {
      sinks.push_back(kv.second);
    }
  }
  if (sinks.empty()) {
    return;
  }
  for (std::size_t i = 0; i + 1 < sinks.size(); ++i) {
    sinks[i]->log(sev, std::string(msg));
  }
  sinks.back()->log(sev, std::move(msg));
}

log_line<false>::log_line(
    severity sev, char const* function, char const* file, int lineno, log& sink, std::string const& identity)
    : os_()
    , sev_(sev)
    , function_(function)
    , file_(file)
    , lineno_(lineno)
    , open_(sink.enabled(sev)) {
  if (not open_) {
    return;
  }
  os_ << "[" << sev_ << "] ";
  if (not identity.empty()) {
    os_ << "[" << identity << "] ";
  }
}

void log_line<false>::write_to(log& sink) {
  open_ = false;
  os_ << " in " << function_ << "(" << file_ << ":" << lineno_ << ")";
  sink.write(sev_, os_.str());
}

} // namespace lw
