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
#include "lw/log_sink.hpp"

#include <mutex>
#include <ostream>

namespace lw {

std::shared_ptr<log_sink> make_ostream_log_sink(std::ostream& os, severity min_severity) {
  auto mu = std::make_shared<std::mutex>();
  return make_log_sink([&os, mu, min_severity](severity sev, std::string&& message) {
    if (sev < min_severity) {
      return;
    }
    std::lock_guard<std::mutex> lock(*mu);
    os << message << std::endl;
  });
}

} // namespace lw
