/* Utopia
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "utopia/test/test_file_util.hpp"
#include <boost/filesystem/fstream.hpp>
#include <iterator>

namespace fs = boost::filesystem;
using Fs_path = fs::path;

namespace utopia::test
{

Temp_file::Temp_file(const std::string& contents, const std::string& extension) :
  m_path(fs::temp_directory_path() / fs::unique_path("utopia-test-%%%%-%%%%-%%%%" + extension))
{
  fs::ofstream os(m_path);
  os << contents;
}

Temp_file::~Temp_file()
{
  Error_code ec;
  fs::remove(m_path, ec); // Nothing to do on failure; the OS cleans the temp directory eventually.
}

const Fs_path& Temp_file::path() const
{
  return m_path;
}

std::string read_file(const Fs_path& file_path)
{
  fs::ifstream is(file_path);
  return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

bool does_file_exist(const Fs_path& file_path, Error_code& ec)
{
  fs::file_status file_status = fs::status(file_path, ec);
  if (file_status.type() == fs::file_not_found)
  {
    // Clear out erroneous error code
    ec.clear();
    return false;
  }

  return !ec;
}

} // namespace utopia::test
