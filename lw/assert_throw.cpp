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
#include "lw/assert_throw.hpp"

#include <sstream>

namespace lw {

[[noreturn]] void raise_assertion_error(
    char const* predicate, char const* function, char const* filename, int lineno, std::string const& detail) {
  std::ostringstream os;
  os << "assertion (" << predicate << ") failed in " << function << "() at " << filename << ":" << lineno;
  if (not detail.empty()) {
    os << " - " << detail;
  }
  throw assertion_error(os.str());
}

} // namespace lw
