/* <base/tmp_file.cc>

   ----------------------------------------------------------------------------
   Copyright 2019 Dave Peterson <dave@dspeterson.com>

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

     http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
   ----------------------------------------------------------------------------

   Implements <base/tmp_file.h>.
 */

#include <base/tmp_file.h>

#include <cstdlib>
#include <utility>
#include <vector>

#include <unistd.h>

#include <base/error_util.h>

using namespace Base;

TTmpFile::TTmpFile(const char *name_template, bool delete_on_destroy)
    : DeleteOnDestroy(delete_on_destroy) {
  assert(name_template);
  std::string tmpl(name_template);
  assert((tmpl.size() >= 6) && (tmpl.substr(tmpl.size() - 6) == "XXXXXX"));
  std::vector<char> name_buf(tmpl.begin(), tmpl.end());
  name_buf.push_back('\0');
  Fd = mkstemp(&name_buf[0]);
  Name = &name_buf[0];
}

TTmpFile::TTmpFile(TTmpFile &&that) noexcept
    : Name(std::move(that.Name)),
      DeleteOnDestroy(that.DeleteOnDestroy),
      Fd(std::move(that.Fd)) {
  /* Make sure 'that' doesn't attempt to delete file on destruction. */
  that.Name.clear();
}

TTmpFile::~TTmpFile() {
  Reset();
}

void TTmpFile::Reset() noexcept {
  assert(this);

  if (DeleteOnDestroy && !Name.empty()) {
    unlink(Name.c_str());
  }

  Name.clear();
  Fd.Reset();
}

std::string Base::MakeTmpFilename(const char *name_template) {
  TTmpFile tmp_file(name_template, true /* delete_on_destroy */);
  return tmp_file.GetName();
}
